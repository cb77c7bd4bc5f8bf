#include "backup/ssh_directory_provider.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <pwd.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::once_flag libssh2InitFlag;

void ensureLibssh2Initialized() {
    std::call_once(libssh2InitFlag, [] {
        int rc = libssh2_init(0);
        if (rc != 0) {
            throw TransportError("libssh2 initialization failed with code " + std::to_string(rc));
        }
    });
}

struct ChannelDeleter {
    void operator()(LIBSSH2_CHANNEL* channel) const {
        libssh2_channel_close(channel);
        libssh2_channel_free(channel);
    }
};
using Channel = std::unique_ptr<LIBSSH2_CHANNEL, ChannelDeleter>;

struct SftpHandleDeleter {
    void operator()(LIBSSH2_SFTP_HANDLE* handle) const {
        libssh2_sftp_close_handle(handle);
    }
};
using SftpHandle = std::unique_ptr<LIBSSH2_SFTP_HANDLE, SftpHandleDeleter>;

struct AgentDeleter {
    void operator()(LIBSSH2_AGENT* agent) const {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
};
using AgentHandle = std::unique_ptr<LIBSSH2_AGENT, AgentDeleter>;

std::string localUserName() {
    struct passwd* pw = getpwuid(getuid());
    if (!pw || !pw->pw_name || !*pw->pw_name) {
        throw ConfigurationError("Remote shell transport has no user and the local login name is unknown");
    }
    return pw->pw_name;
}

// Non-blocking connect bounded by poll, then back to blocking for libssh2.
bool connectWithTimeout(int fd, const sockaddr* address, socklen_t length, int timeoutSeconds,
                        std::string& error) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        error = strerror(errno);
        return false;
    }
    if (::connect(fd, address, length) != 0) {
        if (errno != EINPROGRESS) {
            error = strerror(errno);
            return false;
        }
        struct pollfd pfd {fd, POLLOUT, 0};
        int rc = 0;
        do {
            rc = poll(&pfd, 1, timeoutSeconds * 1000);
        } while (rc < 0 && errno == EINTR);
        if (rc == 0) {
            error = "connection timed out";
            return false;
        }
        if (rc < 0) {
            error = strerror(errno);
            return false;
        }
        int soError = 0;
        socklen_t soLength = sizeof(soError);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &soLength) != 0) {
            error = strerror(errno);
            return false;
        }
        if (soError != 0) {
            error = strerror(soError);
            return false;
        }
    }
    if (fcntl(fd, F_SETFL, flags) < 0) {
        error = strerror(errno);
        return false;
    }
    return true;
}

} // namespace

SshDirectoryProvider::SshDirectoryProvider(const TransportConfig& transport, const SshOptions& options)
    : transport_(transport), options_(options) {
    if (transport_.address.empty()) {
        throw ConfigurationError("Remote shell transport requires a host");
    }
}

SshDirectoryProvider::~SshDirectoryProvider() {
    disconnect();
}

std::string SshDirectoryProvider::describe() const {
    return transport_.describe();
}

std::string SshDirectoryProvider::listingCommand(const std::string& root) {
    return "find " + utils::shellQuote(root) +
           " -mindepth 1 -printf " + utils::shellQuote("%y\\t%s\\t%T@\\t%m\\t%p\\n");
}

void SshDirectoryProvider::openSocket() {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* addresses = nullptr;
    std::string port = std::to_string(transport_.port);
    int rc = getaddrinfo(transport_.address.c_str(), port.c_str(), &hints, &addresses);
    if (rc != 0) {
        throw TransportError("Cannot resolve " + transport_.address + ": " + gai_strerror(rc));
    }

    std::string lastError = "no usable address";
    for (struct addrinfo* ai = addresses; ai && sock_ < 0; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            lastError = strerror(errno);
            continue;
        }
        if (connectWithTimeout(fd, ai->ai_addr, ai->ai_addrlen, options_.connectTimeoutSeconds, lastError)) {
            sock_ = fd;
        } else {
            ::close(fd);
        }
    }
    freeaddrinfo(addresses);

    if (sock_ < 0) {
        throw TransportError("Cannot connect to " + describe() + ": " + lastError);
    }
}

void SshDirectoryProvider::connect() {
    if (session_) {
        return;
    }
    ensureLibssh2Initialized();
    openSocket();

    session_ = libssh2_session_init();
    if (!session_) {
        disconnect();
        throw TransportError("Failed to create SSH session for " + describe());
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, options_.connectTimeoutSeconds * 1000L);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        std::string reason = sessionError();
        disconnect();
        throw TransportError("SSH handshake with " + describe() + " failed: " + reason);
    }

    try {
        authenticate();
    } catch (const BackupError&) {
        disconnect();
        throw;
    }
    Logger::info("SSH session established with " + describe());
}

void SshDirectoryProvider::authenticate() {
    std::string user = transport_.user.empty() ? localUserName() : transport_.user;

    bool authenticated = false;
    if (!transport_.privateKey.empty()) {
        authenticated = libssh2_userauth_publickey_frommemory(
                            session_, user.c_str(), user.size(), nullptr, 0,
                            transport_.privateKey.c_str(), transport_.privateKey.size(), nullptr) == 0;
    } else {
        authenticated = authenticateWithAgent(user);
    }

    if (!authenticated) {
        throw AuthenticationError(AuthenticationError::Reason::Unauthorized,
                                  "SSH authentication failed for " + user + " on " + describe() +
                                      ": " + sessionError());
    }
}

bool SshDirectoryProvider::authenticateWithAgent(const std::string& user) {
    AgentHandle agent(libssh2_agent_init(session_));
    if (!agent) {
        return false;
    }
    if (libssh2_agent_connect(agent.get()) != 0 || libssh2_agent_list_identities(agent.get()) != 0) {
        Logger::warning("No private key configured for " + describe() + " and no ssh-agent available");
        return false;
    }

    struct libssh2_agent_publickey* identity = nullptr;
    struct libssh2_agent_publickey* previous = nullptr;
    while (libssh2_agent_get_identity(agent.get(), &identity, previous) == 0) {
        if (libssh2_agent_userauth(agent.get(), user.c_str(), identity) == 0) {
            return true;
        }
        previous = identity;
    }
    return false;
}

void SshDirectoryProvider::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "Normal shutdown");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
}

std::string SshDirectoryProvider::sessionError() const {
    if (!session_) {
        return "no session";
    }
    char* message = nullptr;
    int length = 0;
    int code = libssh2_session_last_error(session_, &message, &length, 0);
    if (code == LIBSSH2_ERROR_TIMEOUT) {
        return "timed out";
    }
    if (!message || length <= 0) {
        return "error " + std::to_string(code);
    }
    return std::string(message, static_cast<std::size_t>(length));
}

std::string SshDirectoryProvider::sftpError() const {
    if (!sftp_ || libssh2_session_last_errno(session_) != LIBSSH2_ERROR_SFTP_PROTOCOL) {
        return sessionError();
    }
    unsigned long code = libssh2_sftp_last_error(sftp_);
    switch (code) {
        case LIBSSH2_FX_NO_SUCH_FILE:
            return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED:
            return "permission denied";
        default:
            return "SFTP status " + std::to_string(code);
    }
}

SshDirectoryProvider::CommandResult SshDirectoryProvider::execute(const std::string& command,
                                                                  int timeoutSeconds) {
    connect();
    libssh2_session_set_timeout(session_, timeoutSeconds * 1000L);

    Channel channel(libssh2_channel_open_session(session_));
    if (!channel) {
        throw TransportError("Cannot open SSH channel on " + describe() + ": " + sessionError());
    }
    if (libssh2_channel_exec(channel.get(), command.c_str()) != 0) {
        throw TransportError("Cannot start remote command on " + describe() + ": " + sessionError());
    }

    CommandResult result;
    char buffer[16 * 1024];
    auto drain = [&](int stream, std::string& out) {
        for (;;) {
            ssize_t n = libssh2_channel_read_ex(channel.get(), stream, buffer, sizeof(buffer));
            if (n == 0) {
                return;
            }
            if (n < 0) {
                throw TransportError("Remote command on " + describe() + " failed: " + sessionError());
            }
            out.append(buffer, static_cast<std::size_t>(n));
        }
    };
    drain(0, result.output);
    drain(SSH_EXTENDED_DATA_STDERR, result.errors);

    if (libssh2_channel_close(channel.get()) != 0 || libssh2_channel_wait_closed(channel.get()) != 0) {
        throw TransportError("Remote command on " + describe() + " did not finish: " + sessionError());
    }
    result.exitStatus = libssh2_channel_get_exit_status(channel.get());
    return result;
}

std::optional<FileEntry> SshDirectoryProvider::parseListingLine(const std::string& line, const std::string& root) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    for (int i = 0; i < 4; ++i) {
        auto tab = line.find('\t', start);
        if (tab == std::string::npos) {
            return std::nullopt;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    std::string path = line.substr(start);
    if (!path.empty() && path.back() == '\r') {
        path.pop_back();
    }
    if (path.empty()) {
        return std::nullopt;
    }

    FileEntry entry;
    if (fields[0] == "d") {
        entry.type = EntryType::Directory;
    } else if (fields[0] == "f") {
        entry.type = EntryType::File;
    } else {
        return std::nullopt;
    }

    try {
        if (entry.isFile()) {
            entry.size = std::stoll(fields[1]);
        }
        double mtime = std::stod(fields[2]);
        auto seconds = static_cast<long long>(std::floor(mtime));
        auto micros = static_cast<long long>((mtime - static_cast<double>(seconds)) * 1e6);
        entry.lastModified = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(seconds) + std::chrono::microseconds(micros)));
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string mode = fields[3];
    if (mode.size() > 3) {
        mode = mode.substr(mode.size() - 3);
    }
    if (!mode.empty()) {
        entry.permissions = mode;
    }

    entry.path = path;
    entry.root = root;
    entry.name = fs::path(path).filename().string();
    return entry;
}

FileEntryList SshDirectoryProvider::listEntries(const std::string& root) {
    Logger::info("Listing " + root + " via " + describe());

    CommandResult result;
    try {
        result = execute(listingCommand(root), options_.listTimeoutSeconds);
    } catch (const TransportError&) {
        disconnect();
        throw;
    }

    FileEntryList entries;
    std::istringstream lines(result.output);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.empty()) {
            continue;
        }
        auto entry = parseListingLine(line, root);
        if (entry) {
            entries.push_back(std::move(*entry));
        } else {
            Logger::debug("Ignoring listing line: " + line);
        }
    }

    std::string errors = utils::trim(result.errors);
    if (result.exitStatus == 1 && !entries.empty()) {
        // find reports unreadable subdirectories with status 1 but still lists the rest
        Logger::warning("Partial listing of " + root + " on " + describe() + ": " + errors);
    } else if (result.exitStatus != 0) {
        std::string message = "Listing " + root + " on " + describe() +
                              " failed with exit code " + std::to_string(result.exitStatus);
        if (!errors.empty()) {
            message += ": " + errors;
        }
        throw TransportError(message);
    }

    Logger::info("Listed " + std::to_string(entries.size()) + " entries under " + root);
    return entries;
}

void SshDirectoryProvider::fetchFile(const FileEntry& entry, const std::string& targetPath) {
    try {
        download(entry, targetPath);
    } catch (const TransportError&) {
        // the next transfer starts from a fresh session
        disconnect();
        throw;
    }
}

void SshDirectoryProvider::download(const FileEntry& entry, const std::string& targetPath) {
    connect();
    libssh2_session_set_timeout(session_, options_.transferTimeoutSeconds * 1000L);
    if (!sftp_) {
        sftp_ = libssh2_sftp_init(session_);
        if (!sftp_) {
            throw TransportError("Cannot start SFTP on " + describe() + ": " + sessionError());
        }
    }

    SftpHandle handle(libssh2_sftp_open(sftp_, entry.path.c_str(), LIBSSH2_FXF_READ, 0));
    if (!handle) {
        throw TransportError("Cannot open " + entry.path + " on " + describe() + ": " + sftpError());
    }

    std::ofstream out(targetPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw TransportError("Cannot open " + targetPath + " for writing: " + strerror(errno));
    }

    char buffer[64 * 1024];
    for (;;) {
        ssize_t n = libssh2_sftp_read(handle.get(), buffer, sizeof(buffer));
        if (n == 0) {
            break;
        }
        if (n < 0) {
            throw TransportError("Transfer of " + entry.path + " failed: " + sftpError());
        }
        out.write(buffer, n);
        if (!out) {
            throw TransportError("Failed writing " + targetPath);
        }
    }
    out.close();
    if (!out) {
        throw TransportError("Failed writing " + targetPath);
    }
}
