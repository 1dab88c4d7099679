// libssh2 backend: owns the TCP socket, SSH session and SFTP channel of one
// transfer worker. Includes keepalive, known_hosts validation and resume.
#include "bgtransfer/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace bgtransfer {

static std::once_flag g_libssh2_init;

// Context for keyboard-interactive: every prompt that mentions the user
// gets the username, everything else gets the password.
struct KbdIntCtx {
    const char *user;
    const char *pass;
};

static void kbint_password_callback(
    const char * /*name*/, int /*name_len*/, const char * /*instruction*/,
    int /*instruction_len*/, int num_prompts,
    const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
    LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses, void **abstract) {
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt =
            (prompts && prompts[i].text)
                ? std::string(reinterpret_cast<const char *>(prompts[i].text),
                              (size_t)prompts[i].length)
                : std::string();
        for (char &c : prompt) {
            if (c >= 'A' && c <= 'Z')
                c = (char)(c - 'A' + 'a');
        }
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char *ans = wantUser ? ctx->user : ctx->pass;
        const size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (alen == 0)
            continue;
        char *buf = static_cast<char *>(std::malloc(alen + 1));
        if (!buf)
            continue;
        std::memcpy(buf, ans, alen);
        buf[alen] = '\0';
        responses[i].text = buf;
        responses[i].length = (unsigned int)alen;
    }
}

static int knownHostKeyAlgorithm(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

static const char *hostKeyName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "DSA";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ECDSA-521";
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ED25519";
    default:
        return "UNKNOWN";
    }
}

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_init, []() { (void)libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() { disconnect(); }

bool Libssh2SftpClient::fail(SftpErrorKind kind, const std::string &msg,
                             std::string &err) {
    lastKind_ = interrupted_.load() ? SftpErrorKind::Canceled : kind;
    err = interrupted_.load() ? std::string("Interrupted") : msg;
    return false;
}

void Libssh2SftpClient::failFromSftp(const std::string &what,
                                     std::string &err) {
    if (interrupted_.load()) {
        fail(SftpErrorKind::Canceled, what, err);
        return;
    }
    if (!session_ ||
        libssh2_session_last_errno(session_) != LIBSSH2_ERROR_SFTP_PROTOCOL) {
        fail(SftpErrorKind::Connection, what + ": session error", err);
        return;
    }
    const unsigned long code = libssh2_sftp_last_error(sftp_);
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:
    case LIBSSH2_FX_NO_SUCH_PATH:
        fail(SftpErrorKind::NotFound, what + ": no such file", err);
        return;
    case LIBSSH2_FX_PERMISSION_DENIED:
    case LIBSSH2_FX_WRITE_PROTECT:
        fail(SftpErrorKind::PermissionDenied, what + ": permission denied",
             err);
        return;
    case LIBSSH2_FX_NO_CONNECTION:
    case LIBSSH2_FX_CONNECTION_LOST:
        fail(SftpErrorKind::Connection, what + ": connection lost", err);
        return;
    default:
        fail(SftpErrorKind::Remote,
             what + " (sftp status " + std::to_string(code) + ")", err);
        return;
    }
}

bool Libssh2SftpClient::tcpConnect(const std::string &host, uint16_t port,
                                   std::string &err) {
    struct addrinfo hints {};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0)
        return fail(SftpErrorKind::Connection,
                    std::string("getaddrinfo: ") + gai_strerror(gai), err);

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    return fail(SftpErrorKind::Connection, "Could not connect to host/port",
                err);
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions &opt,
                                      std::string &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh)
        return fail(SftpErrorKind::Connection,
                    "Could not initialize known_hosts", err);

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char *home = std::getenv("HOME");
        if (home)
            khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(),
                                               LIBSSH2_KNOWNHOST_FILE_OPENSSH) >=
                    0);
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        return fail(SftpErrorKind::Connection,
                    "known_hosts missing or unreadable (strict policy)", err);
    }

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        return fail(SftpErrorKind::Connection, "Could not read host key", err);
    }

    const int alg = knownHostKeyAlgorithm(keytype);
    const int typemask_plain =
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash =
        LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost *host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain,
                                         &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        std::string fpStr;
        const unsigned char *h = reinterpret_cast<const unsigned char *>(
            libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
        if (h) {
            std::ostringstream oss;
            oss << "SHA256:";
            for (int i = 0; i < 32; ++i) {
                if (i)
                    oss << ':';
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
                oss << b;
            }
            fpStr = oss.str();
        }
        const bool confirmed =
            opt.hostkey_confirm_cb &&
            opt.hostkey_confirm_cb(opt.host, opt.port, hostKeyName(keytype),
                                   fpStr);
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            return fail(SftpErrorKind::Connection,
                        "Unknown host: fingerprint not confirmed", err);
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            return fail(SftpErrorKind::Connection,
                        "known_hosts path is not defined", err);
        }
        const int addMask =
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        const int addrc = libssh2_knownhost_addc(
            nh, opt.host.c_str(), nullptr, hostkey, keylen, nullptr, 0,
            addMask, nullptr);
        const bool written =
            addrc == 0 &&
            libssh2_knownhost_writefile(nh, khPath.c_str(),
                                        LIBSSH2_KNOWNHOST_FILE_OPENSSH) == 0;
        libssh2_knownhost_free(nh);
        if (!written)
            return fail(SftpErrorKind::Connection,
                        "Could not add host to known_hosts", err);
        return true;
    }

    libssh2_knownhost_free(nh);
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict ||
        check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        return fail(SftpErrorKind::Connection,
                    check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
                        ? "Host key does not match known_hosts"
                        : "Host not present in known_hosts",
                    err);
    }
    return true;
}

bool Libssh2SftpClient::authenticate(const SessionOptions &opt,
                                     std::string &err) {
    // 1) explicit private key first
    if (opt.private_key_path.has_value()) {
        const char *passphrase = opt.private_key_passphrase
                                     ? opt.private_key_passphrase->c_str()
                                     : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(
            session_, opt.username.c_str(), nullptr,
            opt.private_key_path->c_str(), passphrase);
        if (rc != 0)
            return fail(SftpErrorKind::Connection, "Key authentication failed",
                        err);
        return true;
    }

    std::string authlist;
    auto hasMethod = [&](const char *m) {
        return authlist.find(m) != std::string::npos;
    };
    auto loadAuthList = [&]() {
        if (!authlist.empty())
            return;
        char *methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                              (unsigned)opt.username.size());
        authlist = methods ? std::string(methods) : std::string();
    };

    // 2) password, then keyboard-interactive with the same secret
    if (opt.password.has_value()) {
        int rc_pw = -1;
        for (;;) {
            rc_pw = libssh2_userauth_password(session_, opt.username.c_str(),
                                              opt.password->c_str());
            if (rc_pw != LIBSSH2_ERROR_EAGAIN)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (rc_pw == 0)
            return true;
        if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
            rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
            return fail(SftpErrorKind::Connection,
                        "Server closed the connection after password attempt",
                        err);
        }
        loadAuthList();
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str()};
            void **abs = libssh2_session_abstract(session_);
            if (abs)
                *abs = &ctx;
            int rc_kbd = -1;
            for (;;) {
                rc_kbd = libssh2_userauth_keyboard_interactive(
                    session_, opt.username.c_str(), kbint_password_callback);
                if (rc_kbd != LIBSSH2_ERROR_EAGAIN)
                    break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs)
                *abs = nullptr;
            if (rc_kbd == 0)
                return true;
        }
    }

    // 3) ssh-agent as the last resort, with a conservative identity limit
    loadAuthList();
    bool authed = false;
    if (hasMethod("publickey")) {
        LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
        if (agent && libssh2_agent_connect(agent) == 0 &&
            libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey *identity = nullptr;
            struct libssh2_agent_publickey *prev = nullptr;
            int tries = 0;
            const int kMaxAgentTries = 3;
            while (tries < kMaxAgentTries &&
                   libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                prev = identity;
                ++tries;
                int arc = -1;
                for (;;) {
                    arc = libssh2_agent_userauth(agent, opt.username.c_str(),
                                                 identity);
                    if (arc != LIBSSH2_ERROR_EAGAIN)
                        break;
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                if (arc == 0) {
                    authed = true;
                    break;
                }
            }
        }
        if (agent) {
            libssh2_agent_disconnect(agent);
            libssh2_agent_free(agent);
        }
    }
    if (!authed) {
        char *emsgPtr = nullptr;
        int emlen = 0;
        (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
        std::string lastErr = (emsgPtr && emlen > 0)
                                  ? std::string(emsgPtr, (size_t)emlen)
                                  : std::string();
        return fail(SftpErrorKind::Connection,
                    std::string("Authentication failed") +
                        (authlist.empty() ? std::string()
                                          : " (methods: " + authlist + ")") +
                        (lastErr.empty() ? std::string() : ": " + lastErr),
                    err);
    }
    return true;
}

bool Libssh2SftpClient::sshHandshakeAuth(const SessionOptions &opt,
                                         std::string &err) {
    session_ = libssh2_session_init();
    if (!session_)
        return fail(SftpErrorKind::Connection, "libssh2_session_init failed",
                    err);

    if (libssh2_session_handshake(session_, sock_) != 0)
        return fail(SftpErrorKind::Connection, "SSH handshake failed", err);

    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, 20000); // 20s
#endif
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err))
        return false;
    if (!authenticate(opt, err))
        return false;

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_)
        return fail(SftpErrorKind::Connection, "Could not initialize SFTP",
                    err);
    return true;
}

bool Libssh2SftpClient::connect(const SessionOptions &opt, std::string &err) {
    if (connected_)
        return fail(SftpErrorKind::Connection, "Already connected", err);
    interrupted_ = false;
    lastKind_ = SftpErrorKind::None;
    if (!tcpConnect(opt.host, opt.port, err))
        return false;
    if (!sshHandshakeAuth(opt, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

void Libssh2SftpClient::interrupt() {
    interrupted_ = true;
    // Shutting the socket down makes blocking libssh2 reads/writes return.
    const int s = sock_;
    if (s != -1)
        ::shutdown(s, SHUT_RDWR);
}

// Downloads a remote file to a local path. Reports progress and honors
// cancellation between chunks.
bool Libssh2SftpClient::get(const std::string &remote,
                            const std::string &local, std::string &err,
                            ProgressCB progress, CancelCB shouldCancel,
                            bool resume) {
    if (!connected_ || !sftp_)
        return fail(SftpErrorKind::Connection, "Not connected", err);

    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        failFromSftp("Remote stat failed", err);
        return false;
    }
    std::size_t total =
        (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::size_t)st.filesize : 0;

    LIBSSH2_SFTP_HANDLE *rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(), LIBSSH2_FXF_READ, 0,
        LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        failFromSftp("Could not open remote file for reading", err);
        return false;
    }

    FILE *lf = nullptr;
    std::size_t offset = 0;
    if (resume) {
        lf = ::fopen(local.c_str(), "ab");
        if (lf) {
            long cur = std::ftell(lf);
            if (cur > 0)
                offset = (std::size_t)cur;
            if (offset > 0 && offset < total)
                libssh2_sftp_seek64(rh, (libssh2_uint64_t)offset);
        }
    }
    if (!lf)
        lf = ::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        return fail(SftpErrorKind::LocalIo,
                    "Could not open local file for writing", err);
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = offset;

    while (true) {
        if (shouldCancel && shouldCancel()) {
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return fail(SftpErrorKind::Canceled, "Canceled", err);
        }
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
                std::fclose(lf);
                libssh2_sftp_close(rh);
                return fail(SftpErrorKind::LocalIo, "Local write failed", err);
            }
            done += (std::size_t)n;
            if (progress)
                progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            std::fclose(lf);
            libssh2_sftp_close(rh);
            failFromSftp("Remote read failed", err);
            return false;
        }
    }

    std::fclose(lf);
    libssh2_sftp_close(rh);
    lastKind_ = SftpErrorKind::None;
    return true;
}

// Uploads a local file (create/truncate, or append when resuming).
bool Libssh2SftpClient::put(const std::string &local,
                            const std::string &remote, std::string &err,
                            ProgressCB progress, CancelCB shouldCancel,
                            bool resume) {
    if (!connected_ || !sftp_)
        return fail(SftpErrorKind::Connection, "Not connected", err);

    FILE *lf = ::fopen(local.c_str(), "rb");
    if (!lf)
        return fail(SftpErrorKind::LocalIo,
                    "Could not open local file for reading", err);

    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    std::size_t total = fsz > 0 ? (std::size_t)fsz : 0;

    long startOffset = 0;
    if (resume) {
        LIBSSH2_SFTP_ATTRIBUTES stR{};
        if (libssh2_sftp_stat_ex(sftp_, remote.c_str(),
                                 (unsigned)remote.size(), LIBSSH2_SFTP_STAT,
                                 &stR) == 0 &&
            (stR.flags & LIBSSH2_SFTP_ATTR_SIZE)) {
            startOffset = (long)stR.filesize;
        }
    }
    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT |
                          (resume ? 0 : LIBSSH2_FXF_TRUNC);
    LIBSSH2_SFTP_HANDLE *wh =
        libssh2_sftp_open_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                             flags, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        failFromSftp("Could not open remote file for writing", err);
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;

    if (resume && startOffset > 0 && (std::size_t)startOffset < total) {
        libssh2_sftp_seek64(wh, (libssh2_uint64_t)startOffset);
        if (std::fseek(lf, startOffset, SEEK_SET) != 0) {
            libssh2_sftp_close(wh);
            std::fclose(lf);
            return fail(SftpErrorKind::LocalIo,
                        "Could not seek local file", err);
        }
        done = (std::size_t)startOffset;
    }

    while (true) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return fail(SftpErrorKind::LocalIo, "Local read failed", err);
            }
            break; // EOF
        }
        char *p = buf.data();
        size_t remain = n;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                libssh2_sftp_close(wh);
                std::fclose(lf);
                return fail(SftpErrorKind::Canceled, "Canceled", err);
            }
            ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                libssh2_sftp_close(wh);
                std::fclose(lf);
                failFromSftp("Remote write failed", err);
                return false;
            }
            remain -= (size_t)w;
            p += w;
            done += (size_t)w;
            if (progress)
                progress(done, total);
        }
    }

    libssh2_sftp_close(wh);
    std::fclose(lf);
    lastKind_ = SftpErrorKind::None;
    return true;
}

// Lightweight existence check through sftp_stat.
bool Libssh2SftpClient::exists(const std::string &remote_path, bool &isDir,
                               std::string &err) {
    isDir = false;
    if (!connected_ || !sftp_)
        return fail(SftpErrorKind::Connection, "Not connected", err);

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                                  (unsigned)remote_path.size(),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc == 0) {
        if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            isDir = ((st.permissions & LIBSSH2_SFTP_S_IFMT) ==
                     LIBSSH2_SFTP_S_IFDIR);
        }
        return true;
    }

    unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
    if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE ||
        sftp_err == LIBSSH2_FX_FAILURE) {
        err.clear();
        return false;
    }
    failFromSftp("Remote stat failed", err);
    return false;
}

bool Libssh2SftpClient::mkdir(const std::string &remote_dir, std::string &err,
                              unsigned int mode) {
    if (!connected_ || !sftp_)
        return fail(SftpErrorKind::Connection, "Not connected", err);
    int rc = libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode);
    if (rc != 0) {
        failFromSftp("sftp_mkdir failed", err);
        return false;
    }
    return true;
}

std::unique_ptr<SftpClient>
Libssh2SftpClient::newConnectionLike(const SessionOptions &opt,
                                     std::string &err) {
    auto ptr = std::make_unique<Libssh2SftpClient>();
    if (!ptr->connect(opt, err)) {
        lastKind_ = ptr->lastErrorKind();
        return nullptr;
    }
    return ptr;
}

} // namespace bgtransfer
