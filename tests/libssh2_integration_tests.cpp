// Integration tests for the real Libssh2SftpClient against a test SFTP
// server. The test is skipped (exit code 77) unless the required
// BGTRANSFER_IT_* env vars exist.
#include "bgtransfer/Libssh2SftpClient.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    char *end = nullptr;
    const long n = std::strtol(raw->c_str(), &end, 10);
    if (!end || *end != '\0' || n < 1 || n > 65535)
        return false;
    out = static_cast<std::uint16_t>(n);
    return true;
}

} // namespace

int main() {
    const auto host = envValue("BGTRANSFER_IT_SFTP_HOST");
    const auto user = envValue("BGTRANSFER_IT_SFTP_USER");
    const auto pass = envValue("BGTRANSFER_IT_SFTP_PASS");
    const auto keyPath = envValue("BGTRANSFER_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("BGTRANSFER_IT_SFTP_KEY_PASSPHRASE");
    const std::string remoteBase =
        envValue("BGTRANSFER_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] bgtransfer_sftp_integration_tests requires env "
                     "vars: "
                  << "BGTRANSFER_IT_SFTP_HOST, BGTRANSFER_IT_SFTP_USER and "
                     "one auth method "
                  << "(BGTRANSFER_IT_SFTP_PASS or BGTRANSFER_IT_SFTP_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] BGTRANSFER_IT_SFTP_KEY does not exist: "
                  << *keyPath << "\n";
        return EXIT_FAILURE;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("BGTRANSFER_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] BGTRANSFER_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    bgtransfer::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    if (pass.has_value())
        opt.password = *pass;
    if (keyPath.has_value()) {
        opt.private_key_path = *keyPath;
        if (keyPassphrase.has_value())
            opt.private_key_passphrase = *keyPassphrase;
    }
    opt.known_hosts_policy = bgtransfer::KnownHostsPolicy::Off;

    const std::string token = uniqueToken();
    const std::string remoteSuiteDir =
        joinRemotePath(remoteBase, "bgtransfer-it-" + token);
    const std::string remoteSrc = joinRemotePath(remoteSuiteDir, "payload.txt");
    const std::string remoteMissing =
        joinRemotePath(remoteSuiteDir, "missing.txt");

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("bgtransfer-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    const fs::path localSrc = localTmpRoot / "payload.txt";
    const fs::path localDst = localTmpRoot / "payload-downloaded.txt";
    const std::string payload(200 * 1024, 'x'); // several 64 KiB chunks
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FAIL] could not create source file\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        out << payload;
    }

    bgtransfer::Libssh2SftpClient prototype;
    std::string err;
    auto client = prototype.newConnectionLike(opt, err);
    t.check(static_cast<bool>(client),
            std::string("newConnectionLike should connect: ") + err);
    if (t.failures == 0) {
        err.clear();
        t.check(client->mkdir(remoteSuiteDir, err, 0755),
                std::string("mkdir remoteSuiteDir should succeed: ") + err);
    }
    if (t.failures == 0) {
        std::size_t lastDone = 0;
        int calls = 0;
        err.clear();
        t.check(client->put(localSrc.string(), remoteSrc, err,
                            [&](std::size_t done, std::size_t) {
                                lastDone = done;
                                ++calls;
                            }),
                std::string("put should succeed: ") + err);
        t.check(calls > 1, "put should report progress per chunk");
        t.check(lastDone == payload.size(),
                "put progress should end at the file size");
    }
    if (t.failures == 0) {
        bool isDir = true;
        err.clear();
        const bool ex = client->exists(remoteSrc, isDir, err);
        t.check(ex, std::string("exists(remoteSrc) should be true: ") + err);
        t.check(!isDir, "exists(remoteSrc) should report file");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client->get(remoteSrc, localDst.string(), err),
                std::string("get should succeed: ") + err);
        std::string downloaded;
        t.check(readFile(localDst, downloaded),
                "downloaded file should be readable");
        t.check(downloaded == payload,
                "downloaded content should match uploaded payload");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(!client->get(remoteMissing, localDst.string(), err),
                "get of a missing file should fail");
        t.check(client->lastErrorKind() == bgtransfer::SftpErrorKind::NotFound,
                "missing file should be classified as NotFound");
    }
    if (t.failures == 0) {
        err.clear();
        const bool ok = client->get(remoteSrc, localDst.string(), err, {},
                                    [] { return true; });
        t.check(!ok, "get should stop when shouldCancel returns true");
        t.check(client->lastErrorKind() == bgtransfer::SftpErrorKind::Canceled,
                "canceled get should be classified as Canceled");
    }

    if (client)
        client->disconnect();
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] bgtransfer_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
