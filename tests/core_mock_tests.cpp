// Core unit tests without external framework (run via CTest).
#include "bgtransfer/MockSftpClient.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

bgtransfer::SessionOptions validOptions() {
    bgtransfer::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

fs::path scratchFile(const std::string &name) {
    return fs::temp_directory_path() /
           ("bgtransfer-core-" +
            std::to_string(std::chrono::steady_clock::now()
                               .time_since_epoch()
                               .count()) +
            "-" + name);
}

std::string readAll(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
}

void test_session_defaults(TestContext &t) {
    bgtransfer::SessionOptions o;
    t.check(o.port == 22, "default port should be 22");
    t.check(o.known_hosts_policy == bgtransfer::KnownHostsPolicy::Strict,
            "default known_hosts_policy should be Strict");
    t.check(!o.password.has_value(), "password should be empty by default");
    t.check(!o.private_key_path.has_value(),
            "private_key_path should be empty by default");
    t.check(!o.hostkey_confirm_cb,
            "hostkey_confirm_cb should be empty by default");
}

void test_connect_validation(TestContext &t) {
    bgtransfer::MockSftpClient c;
    std::string err;
    bgtransfer::SessionOptions opt;
    opt.host = "";
    opt.username = "user";
    t.check(!c.connect(opt, err), "connect should fail when host is empty");
    t.check(c.lastErrorKind() == bgtransfer::SftpErrorKind::Connection,
            "invalid options should be a Connection failure");

    err.clear();
    opt.host = "example.test";
    opt.username.clear();
    t.check(!c.connect(opt, err), "connect should fail when username is empty");

    err.clear();
    opt.username = "alice";
    t.check(c.connect(opt, err), "connect should succeed with host+username");
    t.check(c.isConnected(),
            "client should report connected after successful connect");
    c.disconnect();
    t.check(!c.isConnected(), "disconnect should flip isConnected to false");
}

void test_transfers_require_connection(TestContext &t) {
    bgtransfer::MockSftpClient c;
    std::string err;
    t.check(!c.get("/remote", "/tmp/never", err),
            "get should fail when disconnected");
    t.checkContains(err, "Not connected", "get should explain the failure");
    err.clear();
    bool isDir = true;
    t.check(!c.exists("/", isDir, err), "exists should fail when disconnected");
    t.check(!isDir, "exists should reset isDir");
}

void test_get_writes_file_with_progress(TestContext &t) {
    bgtransfer::MockSftpClient c;
    c.setRemoteFile("/data/report.csv", "0123456789abcdefghij");
    c.setChunkSize(8);
    std::string err;
    t.check(c.connect(validOptions(), err), "connect before get");

    const fs::path local = scratchFile("report.csv");
    std::vector<std::size_t> seen;
    std::size_t lastTotal = 0;
    const bool ok = c.get("/data/report.csv", local.string(), err,
                          [&](std::size_t done, std::size_t total) {
                              seen.push_back(done);
                              lastTotal = total;
                          });
    t.check(ok, "get should succeed: " + err);
    t.check(readAll(local) == "0123456789abcdefghij",
            "downloaded content should match remote file");
    t.check(seen.size() == 3, "20 bytes in chunks of 8 should report 3 times");
    t.check(!seen.empty() && seen.back() == 20, "progress should end at 20");
    t.check(lastTotal == 20, "progress should carry the total size");
    fs::remove(local);
}

void test_get_resume_appends(TestContext &t) {
    bgtransfer::MockSftpClient c;
    c.setRemoteFile("/data/big.bin", "AAAABBBBCCCC");
    std::string err;
    t.check(c.connect(validOptions(), err), "connect before resume");

    const fs::path local = scratchFile("big.bin");
    {
        std::ofstream out(local, std::ios::binary);
        out << "AAAA";
    }
    std::size_t first = 0;
    t.check(c.get("/data/big.bin", local.string(), err,
                  [&](std::size_t done, std::size_t) {
                      if (first == 0)
                          first = done;
                  },
                  {}, true),
            "resumed get should succeed: " + err);
    t.check(readAll(local) == "AAAABBBBCCCC",
            "resume should append the missing tail");
    t.check(first > 4, "resumed progress should start past the local part");
    fs::remove(local);
}

void test_put_and_exists(TestContext &t) {
    bgtransfer::MockSftpClient c;
    std::string err;
    t.check(c.connect(validOptions(), err), "connect before put");

    const fs::path local = scratchFile("upload.txt");
    {
        std::ofstream out(local, std::ios::binary);
        out << "payload";
    }
    t.check(c.mkdir("/inbox", err), "mkdir should succeed: " + err);
    t.check(c.put(local.string(), "/inbox/upload.txt", err),
            "put should succeed: " + err);
    auto stored = c.remoteFile("/inbox/upload.txt");
    t.check(stored.has_value() && *stored == "payload",
            "uploaded content should be stored remotely");

    bool isDir = true;
    err.clear();
    t.check(c.exists("/inbox/upload.txt", isDir, err) && !isDir,
            "exists should report the uploaded file");
    t.check(c.exists("/inbox", isDir, err) && isDir,
            "exists should report the created directory");
    err.clear();
    t.check(!c.exists("/inbox/none", isDir, err) && err.empty(),
            "missing path should return false without error");

    err.clear();
    t.check(!c.put((local.string() + ".missing"), "/inbox/x", err),
            "put of a missing local file should fail");
    t.check(c.lastErrorKind() == bgtransfer::SftpErrorKind::LocalIo,
            "missing local file should be LocalIo");
    fs::remove(local);
}

void test_error_classification(TestContext &t) {
    bgtransfer::MockSftpClient c;
    std::string err;
    t.check(c.connect(validOptions(), err), "connect before failures");
    const fs::path local = scratchFile("never");

    t.check(!c.get("/nope", local.string(), err),
            "get of a missing remote file should fail");
    t.check(c.lastErrorKind() == bgtransfer::SftpErrorKind::NotFound,
            "missing remote file should be NotFound");

    c.setRemoteFile("/secret", "x");
    c.failPath("/secret", bgtransfer::SftpErrorKind::PermissionDenied);
    err.clear();
    t.check(!c.get("/secret", local.string(), err),
            "injected failure should fail the get");
    t.check(c.lastErrorKind() == bgtransfer::SftpErrorKind::PermissionDenied,
            "injected kind should be reported");

    c.failPath("/secret", bgtransfer::SftpErrorKind::None);
    err.clear();
    t.check(c.get("/secret", local.string(), err),
            "clearing the injection should let the get succeed");
    t.check(c.lastErrorKind() == bgtransfer::SftpErrorKind::None,
            "success should clear the error kind");
    fs::remove(local);
}

void test_cancel_between_chunks(TestContext &t) {
    bgtransfer::MockSftpClient c;
    c.setRemoteFile("/slow", std::string(64, 'z'));
    c.setChunkSize(4);
    std::string err;
    t.check(c.connect(validOptions(), err), "connect before cancel");
    const fs::path local = scratchFile("slow");
    int calls = 0;
    const bool ok = c.get(
        "/slow", local.string(), err,
        [&](std::size_t, std::size_t) { ++calls; },
        [&]() { return calls >= 2; });
    t.check(!ok, "get should stop once shouldCancel returns true");
    t.check(c.lastErrorKind() == bgtransfer::SftpErrorKind::Canceled,
            "stopped get should be Canceled");
    t.check(calls == 2, "no progress should follow the cancel");
    fs::remove(local);
}

void test_interrupt_releases_held_transfer(TestContext &t) {
    bgtransfer::MockSftpClient proto;
    proto.setRemoteFile("/held", "data");
    proto.setHoldTransfers(true);
    std::string err;
    auto conn = proto.newConnectionLike(validOptions(), err);
    t.check(static_cast<bool>(conn), "connection for hold test");
    if (!conn)
        return;

    const fs::path local = scratchFile("held");
    bool ok = true;
    bgtransfer::SftpErrorKind kind = bgtransfer::SftpErrorKind::None;
    std::thread worker([&]() {
        std::string werr;
        ok = conn->get("/held", local.string(), werr);
        kind = conn->lastErrorKind();
    });
    t.check(proto.waitForHeldTransfers(1, 2000),
            "transfer should park while held");
    conn->interrupt();
    worker.join();
    t.check(!ok, "interrupted transfer should fail");
    t.check(kind == bgtransfer::SftpErrorKind::Canceled,
            "interrupted transfer should be Canceled");
    proto.setHoldTransfers(false);
    fs::remove(local);
}

void test_new_connection_like_shares_state(TestContext &t) {
    bgtransfer::MockSftpClient proto;
    std::string err;
    auto conn = proto.newConnectionLike(validOptions(), err);
    t.check(static_cast<bool>(conn),
            "newConnectionLike should return a client");
    t.check(conn && conn->isConnected(),
            "newConnectionLike client should be connected");
    proto.setRemoteFile("/shared.txt", "x");
    bool isDir = false;
    t.check(conn && conn->exists("/shared.txt", isDir, err),
            "connections should see files seeded on the prototype");
    t.check(proto.connectAttempts() == 1, "one connect attempt recorded");
}

void test_new_connection_like_failures(TestContext &t) {
    bgtransfer::MockSftpClient proto;
    bgtransfer::SessionOptions bad;
    bad.host = "";
    bad.username = "alice";
    std::string err;
    t.check(!proto.newConnectionLike(bad, err),
            "newConnectionLike should fail with invalid options");
    t.check(!err.empty(), "newConnectionLike should report validation errors");

    proto.failNextConnects(2);
    err.clear();
    t.check(!proto.newConnectionLike(validOptions(), err),
            "first injected connect failure");
    t.check(proto.lastErrorKind() == bgtransfer::SftpErrorKind::Connection,
            "prototype should expose the failed connect kind");
    t.check(!proto.newConnectionLike(validOptions(), err),
            "second injected connect failure");
    t.check(static_cast<bool>(proto.newConnectionLike(validOptions(), err)),
            "third connect should succeed");
    t.check(proto.connectAttempts() == 3, "three connect attempts recorded");
}

} // namespace

int main() {
    TestContext t;
    test_session_defaults(t);
    test_connect_validation(t);
    test_transfers_require_connection(t);
    test_get_writes_file_with_progress(t);
    test_get_resume_appends(t);
    test_put_and_exists(t);
    test_error_classification(t);
    test_cancel_between_chunks(t);
    test_interrupt_releases_held_transfer(t);
    test_new_connection_like_shares_state(t);
    test_new_connection_like_failures(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] bgtransfer_core_tests\n";
    return EXIT_SUCCESS;
}
