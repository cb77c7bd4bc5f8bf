#pragma once

#include "backup/backup_plan.hpp"
#include "backup/directory_provider.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <optional>
#include <string>

struct SshOptions {
    int connectTimeoutSeconds = 10;
    int listTimeoutSeconds = 30;
    int transferTimeoutSeconds = 300;
};

// Source tree reached over SSH: a `find -printf` listing on an exec channel
// and SFTP reads for transfers. The session is opened on first use and kept
// until the provider is destroyed or a transport failure drops it.
class SshDirectoryProvider : public DirectoryProvider {
public:
    SshDirectoryProvider(const TransportConfig& transport, const SshOptions& options);
    ~SshDirectoryProvider() override;

    SshDirectoryProvider(const SshDirectoryProvider&) = delete;
    SshDirectoryProvider& operator=(const SshDirectoryProvider&) = delete;

    FileEntryList listEntries(const std::string& root) override;
    void fetchFile(const FileEntry& entry, const std::string& targetPath) override;
    std::string describe() const override;

    // Remote command producing "<type>\t<size>\t<mtime>\t<mode>\t<path>" lines.
    static std::string listingCommand(const std::string& root);

    // Parses one listing line. Returns nullopt for entries that are neither
    // regular files nor directories, and for malformed lines.
    static std::optional<FileEntry> parseListingLine(const std::string& line, const std::string& root);

private:
    struct CommandResult {
        std::string output;
        std::string errors;
        int exitStatus = -1;
    };

    void connect();
    void openSocket();
    void authenticate();
    bool authenticateWithAgent(const std::string& user);
    void disconnect();

    CommandResult execute(const std::string& command, int timeoutSeconds);
    void download(const FileEntry& entry, const std::string& targetPath);

    std::string sessionError() const;
    std::string sftpError() const;

    TransportConfig transport_;
    SshOptions options_;
    int sock_ = -1;
    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_SFTP* sftp_ = nullptr;
};
