#ifndef GOOGLE_DRIVE_CLIENT_H
#define GOOGLE_DRIVE_CLIENT_H

#include <string>
#include <vector>
#include "RemoteDocumentStore.h"
#include "nlohmann/json.hpp" // Requires nlohmann/json dependency

namespace DocsUpload {

using json = nlohmann::json;

/**
 * @brief Where the client sends its requests.
 */
struct DriveEndpoints {
    std::string protocol;
    std::string host;
    std::string authProtocol;
    std::string authHost;
    std::string clientId;
    std::string clientSecret;
};

/**
 * @brief RemoteDocumentStore backed by the Google Drive v3 REST API.
 *
 * This class uses libcurl and nlohmann/json to talk to the API directly.
 * Every call blocks until the HTTP exchange completes.
 */
class GoogleDriveClient : public RemoteDocumentStore {
public:
    explicit GoogleDriveClient(const DriveEndpoints& endpoints);
    ~GoogleDriveClient() override;

    GoogleDriveClient(const GoogleDriveClient&) = delete;
    GoogleDriveClient& operator=(const GoogleDriveClient&) = delete;

    /**
     * @brief Uses @p token as the bearer token and checks it against the
     * "about" endpoint.
     */
    RemoteError authenticate(const std::string& token) override;

    /**
     * @brief Exchanges account credentials for an access token using the
     * OAuth2 password grant on the configured auth host.
     */
    RemoteError authenticate(const std::string& username, const std::string& password) override;

    RemoteResult<std::vector<RemoteFolder>> listFoldersAt(const FolderHandle& parent) override;
    RemoteResult<std::vector<RemoteDocument>> listDocumentsAt(const FolderHandle& parent) override;
    RemoteResult<RemoteFolder> createFolder(const std::string& name, const FolderHandle& parent) override;
    RemoteResult<RemoteDocument> uploadFile(const std::string& localPath,
                                            const std::string& displayName,
                                            const FolderHandle& parent) override;
    RemoteError deleteDocument(const std::string& id) override;

    // --- Helpers exposed for tests ---

    static DocumentKind kindFromMimeType(const std::string& mimeType);

    /**
     * @brief Google type a local file of @p kind is converted to on upload.
     * @return Empty when the file is stored unconverted.
     */
    static std::string conversionMimeType(DocumentKind kind);

    /**
     * @brief Maps an HTTP status to an error kind. Status 0 means the
     * request never completed.
     */
    static RemoteErrorKind classifyStatus(long status, bool isUpload);

    /**
     * @brief Escapes a literal for use inside a single-quoted Drive query.
     */
    static std::string escapeQueryValue(const std::string& value);

    /**
     * @brief Builds the "q" expression selecting the children of @p parent.
     */
    static std::string childrenQuery(const FolderHandle& parent, bool folders);

    static std::string errorMessage(long status, const std::string& body);

private:
    struct HttpResponse {
        long status = 0;
        std::string body;
        std::string transportError;
    };

    // --- API Call Helpers ---
    HttpResponse apiRequest(const std::string& url, const std::string& method,
                            const std::string& body, const std::vector<std::string>& headers);
    RemoteResult<std::vector<json>> listFiles(const std::string& query);
    std::string apiUrl(const std::string& path) const;
    std::string urlEncode(const std::string& value) const;
    RemoteError toError(const HttpResponse& response, bool isUpload) const;

    // --- libcurl Callbacks ---
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    void* m_curlHandle; // void* to avoid including curl.h in header
    DriveEndpoints m_endpoints;
    std::string m_accessToken;
};

} // namespace DocsUpload

#endif // GOOGLE_DRIVE_CLIENT_H
