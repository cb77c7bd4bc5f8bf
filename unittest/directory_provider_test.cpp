#include <gtest/gtest.h>
#include "backup/directory_provider_factory.hpp"
#include "backup/http_directory_provider.hpp"
#include "backup/local_directory.hpp"
#include "backup/ssh_directory_provider.hpp"
#include "common/agent_rest_client.hpp"
#include "common/backup_errors.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <sys/stat.h>

using namespace testsupport;

namespace {

std::vector<std::string> relativePaths(const FileEntryList& entries, const std::string& root) {
    std::vector<std::string> result;
    for (const auto& entry : entries) {
        result.push_back(fs::relative(entry.path, root).generic_string());
    }
    return result;
}

} // namespace

class LocalDirectoryTest : public ::testing::Test {
protected:
    TempDir tmp_;
};

// Test directories-first ordering with each subtree after its directory
TEST_F(LocalDirectoryTest, ListingOrder) {
    writeFile(tmp_.sub("b.txt"), 2);
    writeFile(tmp_.sub("a.txt"), 1);
    writeFile(tmp_.sub("zdir/inner.txt"), 3);
    writeFile(tmp_.sub("adir/deep/x.txt"), 4);

    auto entries = LocalDirectory::listEntries(tmp_.str());

    EXPECT_EQ(relativePaths(entries, tmp_.str()),
              (std::vector<std::string>{"adir", "adir/deep", "adir/deep/x.txt", "zdir",
                                        "zdir/inner.txt", "a.txt", "b.txt"}));
    EXPECT_TRUE(entries[0].isDirectory());
    EXPECT_FALSE(entries[0].size.has_value());
    EXPECT_EQ(entries[2].size.value_or(-1), 4);
    EXPECT_EQ(entries[2].name, "x.txt");
    EXPECT_EQ(entries[2].root, tmp_.str());
}

TEST_F(LocalDirectoryTest, MissingRootIsCreatedUnlessAsked) {
    std::string root = tmp_.sub("new/dest");

    EXPECT_TRUE(LocalDirectory::listEntries(root, false, false).empty());
    EXPECT_FALSE(fs::exists(root));

    EXPECT_TRUE(LocalDirectory::listEntries(root).empty());
    EXPECT_TRUE(fs::is_directory(root));
}

TEST_F(LocalDirectoryTest, TraversalIsRejected) {
    EXPECT_THROW(LocalDirectory::listEntries(tmp_.str() + "/../elsewhere"), DestinationError);
    EXPECT_THROW(LocalDirectory::listEntries(""), DestinationError);
}

TEST_F(LocalDirectoryTest, FileAsRootIsRejected) {
    writeFile(tmp_.sub("plain"), 1);
    EXPECT_THROW(LocalDirectory::listEntries(tmp_.sub("plain")), DestinationError);
}

TEST_F(LocalDirectoryTest, ChecksumsOnRequest) {
    {
        std::ofstream file(tmp_.sub("abc.txt"));
        file << "abc";
    }

    auto plain = LocalDirectory::listEntries(tmp_.str());
    ASSERT_EQ(plain.size(), 1u);
    EXPECT_FALSE(plain[0].md5.has_value());

    auto hashed = LocalDirectory::listEntries(tmp_.str(), true);
    EXPECT_EQ(hashed[0].md5.value_or(""), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(LocalDirectory::md5OfFile(tmp_.sub("missing")), "");
}

// Test that transfers in flight stay out of listings
TEST_F(LocalDirectoryTest, StagingFilesAreNotListed) {
    writeFile(tmp_.sub("a.txt"), 1);
    std::string staging = LocalDirectory::stagingPathFor(tmp_.sub("a.txt"));
    writeFile(staging, 1);

    EXPECT_EQ(fs::path(staging).parent_path(), tmp_.path());
    EXPECT_TRUE(LocalDirectory::isStagingName(fs::path(staging).filename().string()));
    EXPECT_NE(staging, LocalDirectory::stagingPathFor(tmp_.sub("a.txt")));

    auto entries = LocalDirectory::listEntries(tmp_.str());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "a.txt");

    EXPECT_FALSE(LocalDirectory::isStagingName("a.txt.partial"));
    EXPECT_FALSE(LocalDirectory::isStagingName(".hidden.tmp"));
}

TEST_F(LocalDirectoryTest, SymlinksAreReportedNotListed) {
    writeFile(tmp_.sub("dir/a.txt"), 1);
    fs::create_symlink(tmp_.sub("dir/a.txt"), tmp_.sub("dir/alias"));

    std::vector<std::string> links;
    auto entries = LocalDirectory::listEntries(tmp_.str(), false, true, &links);

    EXPECT_EQ(relativePaths(entries, tmp_.str()), (std::vector<std::string>{"dir", "dir/a.txt"}));
    EXPECT_EQ(links, (std::vector<std::string>{tmp_.sub("dir/alias")}));
}

TEST_F(LocalDirectoryTest, Permissions) {
    writeFile(tmp_.sub("secret"), 1);
    chmod(tmp_.sub("secret").c_str(), 0640);
    EXPECT_EQ(LocalDirectory::permissionsOf(tmp_.sub("secret")), "640");
}

class SshDirectoryProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_.kind = TransportKind::RemoteShell;
        transport_.address = "127.0.0.1";
        transport_.user = "backup";
        options_.connectTimeoutSeconds = 5;
        options_.listTimeoutSeconds = 5;
    }

    TempDir tmp_;
    TransportConfig transport_;
    SshOptions options_;
};

TEST_F(SshDirectoryProviderTest, ListingCommand) {
    EXPECT_EQ(SshDirectoryProvider::listingCommand("/srv/my data"),
              "find '/srv/my data' -mindepth 1 -printf '%y\\t%s\\t%T@\\t%m\\t%p\\n'");
    EXPECT_EQ(SshDirectoryProvider::listingCommand("/it's"),
              "find '/it'\\''s' -mindepth 1 -printf '%y\\t%s\\t%T@\\t%m\\t%p\\n'");
}

TEST_F(SshDirectoryProviderTest, ParseFileLine) {
    auto entry = SshDirectoryProvider::parseListingLine(
        "f\t1234\t1700000000.5000000000\t100644\t/srv/data/sub/report.pdf", "/srv/data");
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->isFile());
    EXPECT_EQ(entry->size.value_or(0), 1234);
    EXPECT_EQ(entry->name, "report.pdf");
    EXPECT_EQ(entry->path, "/srv/data/sub/report.pdf");
    EXPECT_EQ(entry->root, "/srv/data");
    EXPECT_EQ(entry->permissions.value_or(""), "644");
    EXPECT_EQ(std::chrono::time_point_cast<std::chrono::seconds>(entry->lastModified),
              std::chrono::time_point_cast<std::chrono::seconds>(
                  std::chrono::system_clock::from_time_t(1700000000)));
}

TEST_F(SshDirectoryProviderTest, ParseDirectoryLineDropsSize) {
    auto entry = SshDirectoryProvider::parseListingLine("d\t4096\t1700000000.0\t755\t/srv/data/sub",
                                                        "/srv/data");
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->isDirectory());
    EXPECT_FALSE(entry->size.has_value());
}

TEST_F(SshDirectoryProviderTest, PathsWithTabsSurvive) {
    auto entry = SshDirectoryProvider::parseListingLine("f\t1\t1.0\t644\t/srv/odd\tname", "/srv");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->path, "/srv/odd\tname");
}

TEST_F(SshDirectoryProviderTest, RejectsOtherTypesAndGarbage) {
    EXPECT_FALSE(SshDirectoryProvider::parseListingLine("l\t7\t1.0\t777\t/srv/link", "/srv").has_value());
    EXPECT_FALSE(SshDirectoryProvider::parseListingLine("f\tbig\t1.0\t644\t/srv/x", "/srv").has_value());
    EXPECT_FALSE(SshDirectoryProvider::parseListingLine("f\t1\t1.0\t644\t", "/srv").has_value());
    EXPECT_FALSE(SshDirectoryProvider::parseListingLine("garbage", "/srv").has_value());
}

TEST_F(SshDirectoryProviderTest, Describe) {
    transport_.address = "files.example";
    transport_.port = 2222;
    SshDirectoryProvider provider(transport_, options_);
    EXPECT_EQ(provider.describe(), "ssh backup@files.example:2222");
}

TEST_F(SshDirectoryProviderTest, MissingHostIsConfigurationError) {
    transport_.address.clear();
    EXPECT_THROW(SshDirectoryProvider(transport_, options_), ConfigurationError);
}

// Test that nothing is contacted until the first listing or transfer
TEST_F(SshDirectoryProviderTest, ConnectsOnFirstUse) {
    transport_.address = "unresolvable.invalid";
    EXPECT_NO_THROW(SshDirectoryProvider(transport_, options_));
}

TEST_F(SshDirectoryProviderTest, UnresolvableHostIsTransportError) {
    transport_.address = "unresolvable.invalid";
    SshDirectoryProvider provider(transport_, options_);
    EXPECT_THROW(provider.listEntries("/srv"), TransportError);
}

TEST_F(SshDirectoryProviderTest, RefusedConnectionIsTransportError) {
    int port = 0;
    {
        LoopbackServer closed("", false);
        port = closed.port();
    }
    transport_.port = port;
    SshDirectoryProvider provider(transport_, options_);
    EXPECT_THROW(provider.listEntries("/srv"), TransportError);
}

// Test that a peer which is not an SSH server fails the handshake
TEST_F(SshDirectoryProviderTest, NonSshPeerIsTransportError) {
    LoopbackServer server("HTTP/1.1 400 Bad Request\r\n\r\n", false);
    transport_.port = server.port();
    SshDirectoryProvider provider(transport_, options_);

    EXPECT_THROW(provider.listEntries("/srv"), TransportError);
    FileEntry entry = makeFile("/srv", "a.txt", 1);
    EXPECT_THROW(provider.fetchFile(entry, tmp_.sub("a.txt")), TransportError);
    EXPECT_FALSE(fs::exists(tmp_.sub("a.txt")));
}

class HttpDirectoryProviderTest : public ::testing::Test {
};

TEST_F(HttpDirectoryProviderTest, ParseListing) {
    auto listing = nlohmann::json::parse(R"([
        {"name": "docs", "path": "C:\\share\\docs", "type": "directory", "size": 0,
         "lastModified": "2024-02-01T10:00:00Z"},
        {"name": "a.txt", "path": "C:\\share\\docs\\a.txt", "type": "file", "size": 42,
         "lastModified": "2024-02-01T10:00:00.250Z", "permissions": "644", "md5": "abc"}
    ])");

    auto entries = HttpDirectoryProvider::parseListing(listing, "C:\\share");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_TRUE(entries[0].isDirectory());
    EXPECT_FALSE(entries[0].size.has_value());
    EXPECT_EQ(entries[1].size.value_or(0), 42);
    EXPECT_EQ(entries[1].root, "C:\\share");
    EXPECT_EQ(entries[1].md5.value_or(""), "abc");
    EXPECT_EQ(entries[1].lastModified, *utils::parseIso8601("2024-02-01T10:00:00.250Z"));
}

TEST_F(HttpDirectoryProviderTest, MalformedListingIsTransportError) {
    EXPECT_THROW(HttpDirectoryProvider::parseListing(nlohmann::json::object(), "/"), TransportError);
    EXPECT_THROW(HttpDirectoryProvider::parseListing(nlohmann::json::parse(R"([{"name": "x"}])"), "/"),
                 TransportError);
    EXPECT_THROW(HttpDirectoryProvider::parseListing(
                     nlohmann::json::parse(R"([{"name": "x", "path": "/x", "type": "socket"}])"), "/"),
                 TransportError);
}

TEST_F(HttpDirectoryProviderTest, EntryJsonRoundTrip) {
    FileEntry entry = makeFile("/srv", "a.txt", 9);
    entry.permissions = "600";
    auto restored = entryFromJson(entryToJson(entry), "/srv");
    EXPECT_EQ(restored.path, entry.path);
    EXPECT_EQ(restored.size, entry.size);
    EXPECT_EQ(restored.permissions, entry.permissions);
    EXPECT_FALSE(restored.md5.has_value());
}

TEST_F(HttpDirectoryProviderTest, BaseUrlNormalization) {
    EXPECT_EQ(AgentRestClient::normalizeBaseUrl("office"), "https://office");
    EXPECT_EQ(AgentRestClient::normalizeBaseUrl("office:5001/"), "https://office:5001");
    EXPECT_EQ(AgentRestClient::normalizeBaseUrl(" http://10.0.0.5:8080 "), "http://10.0.0.5:8080");
}

TEST_F(HttpDirectoryProviderTest, FactoryPicksVariant) {
    ServiceConfig config;
    TransportConfig http;
    http.kind = TransportKind::AgentHttp;
    http.address = "office:5001";
    http.token = "tok";
    auto agent = createDirectoryProvider(http, config);
    EXPECT_EQ(agent->describe(), "agent https://office:5001");

    TransportConfig shell;
    shell.address = "files.example";
    auto ssh = makeProviderFactory(config)(shell);
    EXPECT_EQ(ssh->describe(), "ssh files.example:22");

    http.token.clear();
    EXPECT_THROW(createDirectoryProvider(http, config), ConfigurationError);
}

class AgentRestClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("no_proxy", "127.0.0.1", 1);
        options_.connectTimeoutSeconds = 5;
        options_.listTimeoutSeconds = 5;
        options_.transferTimeoutSeconds = 5;
    }

    AgentClientOptions options_;
};

TEST_F(AgentRestClientTest, RejectedTokenIsAuthenticationError) {
    LoopbackServer server(LoopbackServer::httpReply(401, R"({"message": "token revoked"})"), true);
    AgentRestClient client(server.url(), "tok-123", options_);

    try {
        client.listDirectory("/srv");
        FAIL() << "expected AuthenticationError";
    } catch (const AuthenticationError& e) {
        EXPECT_EQ(e.reason(), AuthenticationError::Reason::Unauthorized);
    }
    EXPECT_NE(client.getLastError().find("token revoked"), std::string::npos);

    std::string request = server.requests();
    EXPECT_EQ(request.rfind("GET /Look?dir=", 0), 0u);
    EXPECT_NE(request.find("X-Agent-Token: tok-123"), std::string::npos);
}

TEST_F(AgentRestClientTest, ServerErrorIsTransportErrorWithStatus) {
    LoopbackServer server(LoopbackServer::httpReply(500, "disk on fire"), true);
    AgentRestClient client(server.url(), "tok", options_);

    try {
        client.listDirectory("/srv");
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.httpStatus(), 500);
    }
    EXPECT_NE(client.getLastError().find("HTTP 500"), std::string::npos);
}

TEST_F(AgentRestClientTest, MissingDownloadIsTransportErrorWithStatus) {
    TempDir tmp;
    LoopbackServer server(LoopbackServer::httpReply(404, ""), true);
    AgentRestClient client(server.url(), "tok", options_);

    try {
        client.downloadFile("/srv/gone.txt", tmp.sub("gone.txt"));
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.httpStatus(), 404);
    }
    EXPECT_EQ(server.requests().rfind("GET /Download?filePath=", 0), 0u);
}

TEST_F(AgentRestClientTest, ListingIsReturned) {
    LoopbackServer server(LoopbackServer::httpReply(200, R"([{"name": "a.txt"}])"), true);
    AgentRestClient client(server.url(), "tok", options_);

    auto listing = client.listDirectory("/srv");
    ASSERT_TRUE(listing.is_array());
    EXPECT_EQ(listing.size(), 1u);
}

// Test that the pairing exchange is unauthenticated and returns the issued token
TEST_F(AgentRestClientTest, PairingReturnsToken) {
    LoopbackServer server(LoopbackServer::httpReply(200, R"({"token": "fresh-token"})"), true);
    AgentRestClient client(server.url(), "", options_);

    EXPECT_EQ(client.verifyPairingCode("123456"), "fresh-token");

    std::string request = server.requests();
    EXPECT_EQ(request.rfind("POST /Pairing/verify", 0), 0u);
    EXPECT_EQ(request.find("X-Agent-Token"), std::string::npos);
    EXPECT_NE(request.find(R"("code":"123456")"), std::string::npos);
}

TEST_F(AgentRestClientTest, ExpiredPairingCode) {
    LoopbackServer server(LoopbackServer::httpReply(400, R"({"reason": "Expired", "message": "code expired"})"),
                          true);
    AgentRestClient client(server.url(), "", options_);

    try {
        client.verifyPairingCode("123456");
        FAIL() << "expected AuthenticationError";
    } catch (const AuthenticationError& e) {
        EXPECT_EQ(e.reason(), AuthenticationError::Reason::Expired);
    }
}

TEST_F(AgentRestClientTest, UnknownPairingCode) {
    LoopbackServer server(LoopbackServer::httpReply(400, "no such code"), true);
    AgentRestClient client(server.url(), "", options_);

    try {
        client.verifyPairingCode("654321");
        FAIL() << "expected AuthenticationError";
    } catch (const AuthenticationError& e) {
        EXPECT_EQ(e.reason(), AuthenticationError::Reason::InvalidCode);
    }
    EXPECT_EQ(client.getLastError(), "no such code");
}

TEST_F(AgentRestClientTest, PairingServerErrorIsTransportError) {
    LoopbackServer server(LoopbackServer::httpReply(502, ""), true);
    AgentRestClient client(server.url(), "", options_);

    try {
        client.verifyPairingCode("123456");
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.httpStatus(), 502);
    }
}

TEST_F(AgentRestClientTest, Ping) {
    {
        LoopbackServer server(LoopbackServer::httpReply(200, "{}"), true);
        AgentRestClient client(server.url(), "tok", options_);
        EXPECT_TRUE(client.ping());
        EXPECT_EQ(server.requests().rfind("GET /Pong", 0), 0u);
    }
    {
        LoopbackServer server(LoopbackServer::httpReply(503, ""), true);
        AgentRestClient client(server.url(), "tok", options_);
        EXPECT_FALSE(client.ping());
        EXPECT_EQ(client.getLastError(), "Ping returned HTTP 503");
    }
}

TEST_F(AgentRestClientTest, UnreachableAgentPingsFalse) {
    std::string url;
    {
        LoopbackServer closed("", false);
        url = closed.url();
    }
    AgentRestClient client(url, "tok", options_);
    EXPECT_FALSE(client.ping());
    EXPECT_THROW(client.listDirectory("/srv"), TransportError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
