#include "bgtransfer/MockSftpClient.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>

namespace bgtransfer {

MockSftpClient::MockSftpClient()
    : state_(std::make_shared<RemoteState>()) {}

MockSftpClient::MockSftpClient(std::shared_ptr<RemoteState> state)
    : state_(std::move(state)) {
    if (!state_)
        state_ = std::make_shared<RemoteState>();
}

bool MockSftpClient::fail(SftpErrorKind kind, const std::string &msg,
                          std::string &err) {
    lastKind_ = kind;
    err = msg;
    return false;
}

bool MockSftpClient::connect(const SessionOptions &opt, std::string &err) {
    if (opt.host.empty() || opt.username.empty())
        return fail(SftpErrorKind::Connection,
                    "Host and username are required", err);
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        ++state_->connectAttempts;
        if (state_->failConnects > 0) {
            --state_->failConnects;
            return fail(SftpErrorKind::Connection,
                        "Connection refused (mock)", err);
        }
    }
    interrupted_ = false;
    connected_ = true;
    lastOpt_ = opt;
    lastKind_ = SftpErrorKind::None;
    return true;
}

void MockSftpClient::disconnect() { connected_ = false; }

void MockSftpClient::interrupt() {
    interrupted_ = true;
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->cv.notify_all();
}

bool MockSftpClient::stopRequested(const CancelCB &shouldCancel) const {
    return interrupted_.load() || (shouldCancel && shouldCancel());
}

bool MockSftpClient::parkIfHeld(const CancelCB &shouldCancel) {
    std::unique_lock<std::mutex> lk(state_->mtx);
    if (!state_->holdTransfers)
        return true;
    ++state_->heldTransfers;
    state_->cv.notify_all();
    // shouldCancel has no notifier, so poll it.
    while (state_->holdTransfers && !interrupted_.load()) {
        lk.unlock();
        const bool stop = shouldCancel && shouldCancel();
        lk.lock();
        if (stop)
            break;
        state_->cv.wait_for(lk, std::chrono::milliseconds(5));
    }
    --state_->heldTransfers;
    state_->cv.notify_all();
    return state_->holdTransfers ? false : !interrupted_.load();
}

bool MockSftpClient::get(const std::string &remote, const std::string &local,
                         std::string &err, ProgressCB progress,
                         CancelCB shouldCancel, bool resume) {
    if (!connected_)
        return fail(SftpErrorKind::Connection, "Not connected", err);

    std::string data;
    std::size_t chunk = 0;
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        auto f = state_->failures.find(remote);
        if (f != state_->failures.end())
            return fail(f->second, "Injected failure: " + remote, err);
        auto it = state_->files.find(remote);
        if (it == state_->files.end())
            return fail(SftpErrorKind::NotFound,
                        "Remote file not found in mock: " + remote, err);
        data = it->second;
        chunk = std::max<std::size_t>(1, state_->chunkSize);
    }

    std::size_t offset = 0;
    if (resume) {
        std::ifstream existing(local, std::ios::binary | std::ios::ate);
        if (existing.is_open()) {
            const auto sz = static_cast<std::size_t>(existing.tellg());
            if (sz < data.size())
                offset = sz;
        }
    }
    std::ofstream out(local, std::ios::binary |
                                 (offset > 0 ? std::ios::app : std::ios::trunc));
    if (!out.is_open())
        return fail(SftpErrorKind::LocalIo,
                    "Could not open local file for writing", err);

    if (!parkIfHeld(shouldCancel) || stopRequested(shouldCancel))
        return fail(SftpErrorKind::Canceled, "Canceled", err);

    std::size_t done = offset;
    while (done < data.size()) {
        if (stopRequested(shouldCancel))
            return fail(SftpErrorKind::Canceled, "Canceled", err);
        const std::size_t n = std::min(chunk, data.size() - done);
        out.write(data.data() + done, static_cast<std::streamsize>(n));
        if (!out)
            return fail(SftpErrorKind::LocalIo, "Local write failed", err);
        done += n;
        if (progress)
            progress(done, data.size());
    }
    lastKind_ = SftpErrorKind::None;
    return true;
}

bool MockSftpClient::put(const std::string &local, const std::string &remote,
                         std::string &err, ProgressCB progress,
                         CancelCB shouldCancel, bool resume) {
    if (!connected_)
        return fail(SftpErrorKind::Connection, "Not connected", err);

    std::ifstream in(local, std::ios::binary);
    if (!in.is_open())
        return fail(SftpErrorKind::LocalIo,
                    "Could not open local file for reading", err);
    const std::string data((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());

    std::string uploaded;
    std::size_t chunk = 0;
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        auto f = state_->failures.find(remote);
        if (f != state_->failures.end())
            return fail(f->second, "Injected failure: " + remote, err);
        if (resume) {
            auto it = state_->files.find(remote);
            if (it != state_->files.end() && it->second.size() < data.size())
                uploaded = it->second;
        }
        chunk = std::max<std::size_t>(1, state_->chunkSize);
    }

    if (!parkIfHeld(shouldCancel) || stopRequested(shouldCancel))
        return fail(SftpErrorKind::Canceled, "Canceled", err);

    while (uploaded.size() < data.size()) {
        if (stopRequested(shouldCancel))
            return fail(SftpErrorKind::Canceled, "Canceled", err);
        const std::size_t n = std::min(chunk, data.size() - uploaded.size());
        uploaded.append(data, uploaded.size(), n);
        if (progress)
            progress(uploaded.size(), data.size());
    }
    {
        std::lock_guard<std::mutex> lk(state_->mtx);
        state_->files[remote] = uploaded;
    }
    lastKind_ = SftpErrorKind::None;
    return true;
}

bool MockSftpClient::exists(const std::string &remote_path, bool &isDir,
                            std::string &err) {
    isDir = false;
    if (!connected_)
        return fail(SftpErrorKind::Connection, "Not connected", err);
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->dirs.count(remote_path)) {
        isDir = true;
        return true;
    }
    if (state_->files.count(remote_path))
        return true;
    err.clear();
    return false;
}

bool MockSftpClient::mkdir(const std::string &remote_dir, std::string &err,
                           unsigned int /*mode*/) {
    if (!connected_)
        return fail(SftpErrorKind::Connection, "Not connected", err);
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->files.count(remote_dir) || state_->dirs.count(remote_dir))
        return fail(SftpErrorKind::Remote, "Path already exists", err);
    state_->dirs.insert(remote_dir);
    return true;
}

std::unique_ptr<SftpClient>
MockSftpClient::newConnectionLike(const SessionOptions &opt,
                                  std::string &err) {
    auto ptr = std::make_unique<MockSftpClient>(state_);
    if (!ptr->connect(opt, err)) {
        lastKind_ = ptr->lastErrorKind();
        return nullptr;
    }
    return ptr;
}

void MockSftpClient::setRemoteFile(const std::string &path,
                                   const std::string &contents) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->files[path] = contents;
}

std::optional<std::string>
MockSftpClient::remoteFile(const std::string &path) const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->files.find(path);
    if (it == state_->files.end())
        return std::nullopt;
    return it->second;
}

void MockSftpClient::failPath(const std::string &path, SftpErrorKind kind) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (kind == SftpErrorKind::None)
        state_->failures.erase(path);
    else
        state_->failures[path] = kind;
}

void MockSftpClient::failNextConnects(int n) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->failConnects = n;
}

int MockSftpClient::connectAttempts() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->connectAttempts;
}

void MockSftpClient::setChunkSize(std::size_t n) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->chunkSize = n;
}

void MockSftpClient::setHoldTransfers(bool hold) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->holdTransfers = hold;
    state_->cv.notify_all();
}

bool MockSftpClient::waitForHeldTransfers(int n, int timeoutMs) const {
    std::unique_lock<std::mutex> lk(state_->mtx);
    return state_->cv.wait_for(lk, std::chrono::milliseconds(timeoutMs), [&] {
        return state_->heldTransfers >= n;
    });
}

} // namespace bgtransfer
