#include "GoogleDriveClient.h"
#include "FormatPolicy.h"
#include "LocalFile.h"
#include "Definitions.h"
#include <fstream>
#include <sstream>
#include <curl/curl.h>

namespace DocsUpload {

namespace {

const std::string FILE_FIELDS = "id,name,mimeType,parents";
const std::string MULTIPART_BOUNDARY = "docs_upload_part_boundary";

std::string rootOrId(const FolderHandle& parent) {
    return parent ? parent->id : "root";
}

} // namespace

GoogleDriveClient::GoogleDriveClient(const DriveEndpoints& endpoints)
    : m_endpoints(endpoints) {
    curl_global_init(CURL_GLOBAL_ALL);
    m_curlHandle = curl_easy_init();
    if (!m_curlHandle) {
        throw DocsUploadException("Failed to initialize libcurl");
    }
}

GoogleDriveClient::~GoogleDriveClient() {
    if (m_curlHandle) {
        curl_easy_cleanup(static_cast<CURL*>(m_curlHandle));
    }
    curl_global_cleanup();
}

// libcurl callback to write data to a std::string
size_t GoogleDriveClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

GoogleDriveClient::HttpResponse GoogleDriveClient::apiRequest(const std::string& url, const std::string& method,
                                                              const std::string& body,
                                                              const std::vector<std::string>& headers) {
    HttpResponse response;
    CURL* curl = static_cast<CURL*>(m_curlHandle);
    curl_easy_reset(curl);

    struct curl_slist* headerList = nullptr;
    if (!m_accessToken.empty()) {
        headerList = curl_slist_append(headerList, ("Authorization: Bearer " + m_accessToken).c_str());
    }
    for (const auto& header : headers) {
        headerList = curl_slist_append(headerList, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, (Definitions::APP_NAME + "/" + Definitions::APP_VERSION).c_str());

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.transportError = curl_easy_strerror(res);
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headerList);
    return response;
}

std::string GoogleDriveClient::apiUrl(const std::string& path) const {
    return m_endpoints.protocol + "://" + m_endpoints.host + path;
}

std::string GoogleDriveClient::urlEncode(const std::string& value) const {
    char* escaped = curl_easy_escape(static_cast<CURL*>(m_curlHandle), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) return value;
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

RemoteError GoogleDriveClient::toError(const HttpResponse& response, bool isUpload) const {
    if (!response.transportError.empty()) {
        return RemoteError::make(RemoteErrorKind::Transient, response.transportError);
    }
    RemoteErrorKind kind = classifyStatus(response.status, isUpload);
    if (kind == RemoteErrorKind::None) return RemoteError{};
    return RemoteError::make(kind, errorMessage(response.status, response.body));
}

// --- Authentication ---

RemoteError GoogleDriveClient::authenticate(const std::string& token) {
    m_accessToken = token;
    HttpResponse response = apiRequest(apiUrl("/drive/v3/about?fields=user"), "GET", "", {});
    RemoteError error = toError(response, false);
    if (error.failed()) m_accessToken.clear();
    return error;
}

RemoteError GoogleDriveClient::authenticate(const std::string& username, const std::string& password) {
    m_accessToken.clear();
    std::string url = m_endpoints.authProtocol + "://" + m_endpoints.authHost + "/token";
    std::string form = "grant_type=password"
                       "&username=" + urlEncode(username) +
                       "&password=" + urlEncode(password) +
                       "&client_id=" + urlEncode(m_endpoints.clientId) +
                       "&client_secret=" + urlEncode(m_endpoints.clientSecret) +
                       "&scope=" + urlEncode("https://www.googleapis.com/auth/drive");

    HttpResponse response = apiRequest(url, "POST", form, {"Content-Type: application/x-www-form-urlencoded"});
    if (!response.transportError.empty()) {
        return RemoteError::make(RemoteErrorKind::Transient, response.transportError);
    }
    if (response.status < 200 || response.status >= 300) {
        return RemoteError::make(RemoteErrorKind::AuthFailure, errorMessage(response.status, response.body));
    }

    json result = json::parse(response.body, nullptr, false);
    if (result.is_discarded() || !result.is_object() || !result.contains("access_token") ||
        !result["access_token"].is_string()) {
        return RemoteError::make(RemoteErrorKind::AuthFailure, "No access token in the auth server response");
    }
    m_accessToken = result["access_token"].get<std::string>();
    return RemoteError{};
}

// --- Listing ---

RemoteResult<std::vector<json>> GoogleDriveClient::listFiles(const std::string& query) {
    std::vector<json> files;
    std::string pageToken;
    do {
        std::string url = apiUrl("/drive/v3/files?pageSize=1000&q=" + urlEncode(query) +
                                 "&fields=" + urlEncode("nextPageToken,files(" + FILE_FIELDS + ")"));
        if (!pageToken.empty()) url += "&pageToken=" + urlEncode(pageToken);

        HttpResponse response = apiRequest(url, "GET", "", {});
        RemoteError error = toError(response, false);
        if (error.failed()) {
            return RemoteResult<std::vector<json>>::failure(error.kind, error.message);
        }

        json page = json::parse(response.body, nullptr, false);
        if (page.is_discarded() || !page.is_object()) {
            return RemoteResult<std::vector<json>>::failure(RemoteErrorKind::Transient, "Malformed listing response");
        }
        try {
            for (const auto& file : page.value("files", json::array())) {
                if (file.is_object()) files.push_back(file);
            }
            pageToken = page.value("nextPageToken", "");
        } catch (const json::exception& e) {
            return RemoteResult<std::vector<json>>::failure(RemoteErrorKind::Transient,
                                                            std::string("Malformed listing response: ") + e.what());
        }
    } while (!pageToken.empty());

    return RemoteResult<std::vector<json>>::success(std::move(files));
}

RemoteResult<std::vector<RemoteFolder>> GoogleDriveClient::listFoldersAt(const FolderHandle& parent) {
    auto listing = listFiles(childrenQuery(parent, true));
    if (!listing.ok()) {
        return RemoteResult<std::vector<RemoteFolder>>::failure(listing.error.kind, listing.error.message);
    }

    std::vector<RemoteFolder> folders;
    try {
        for (const auto& file : *listing.value) {
            RemoteFolder folder;
            folder.id = file.value("id", "");
            folder.title = file.value("name", "");
            folder.kind = kindFromMimeType(file.value("mimeType", ""));
            folders.push_back(folder);
        }
    } catch (const json::exception& e) {
        return RemoteResult<std::vector<RemoteFolder>>::failure(RemoteErrorKind::Transient,
                                                                std::string("Malformed folder entry: ") + e.what());
    }
    return RemoteResult<std::vector<RemoteFolder>>::success(std::move(folders));
}

RemoteResult<std::vector<RemoteDocument>> GoogleDriveClient::listDocumentsAt(const FolderHandle& parent) {
    auto listing = listFiles(childrenQuery(parent, false));
    if (!listing.ok()) {
        return RemoteResult<std::vector<RemoteDocument>>::failure(listing.error.kind, listing.error.message);
    }

    std::vector<RemoteDocument> documents;
    try {
        for (const auto& file : *listing.value) {
            RemoteDocument doc;
            doc.id = file.value("id", "");
            doc.title = file.value("name", "");
            doc.kind = kindFromMimeType(file.value("mimeType", ""));
            doc.parentId = parent ? parent->id : "";
            if (doc.kind != DocumentKind::Folder) documents.push_back(doc);
        }
    } catch (const json::exception& e) {
        return RemoteResult<std::vector<RemoteDocument>>::failure(RemoteErrorKind::Transient,
                                                                  std::string("Malformed document entry: ") + e.what());
    }
    return RemoteResult<std::vector<RemoteDocument>>::success(std::move(documents));
}

// --- Mutations ---

RemoteResult<RemoteFolder> GoogleDriveClient::createFolder(const std::string& name, const FolderHandle& parent) {
    try {
        json metadata = {
            {"name", name},
            {"mimeType", Definitions::FOLDER_MIME_TYPE},
            {"parents", json::array({rootOrId(parent)})}
        };
        std::string payload = metadata.dump();

        HttpResponse response = apiRequest(apiUrl("/drive/v3/files?fields=" + urlEncode(FILE_FIELDS)), "POST",
                                           payload, {"Content-Type: application/json; charset=UTF-8"});
        RemoteError error = toError(response, false);
        if (error.failed()) {
            return RemoteResult<RemoteFolder>::failure(RemoteErrorKind::CreationFailure, error.message);
        }

        json created = json::parse(response.body, nullptr, false);
        if (created.is_discarded() || !created.is_object() || !created.contains("id")) {
            return RemoteResult<RemoteFolder>::failure(RemoteErrorKind::CreationFailure, "Malformed folder response");
        }

        RemoteFolder folder;
        folder.id = created["id"].get<std::string>();
        folder.title = created.value("name", name);
        return RemoteResult<RemoteFolder>::success(folder);

    } catch (const json::exception& e) {
        // names that are not valid UTF-8 cannot be serialized
        return RemoteResult<RemoteFolder>::failure(RemoteErrorKind::CreationFailure, e.what());
    }
}

RemoteResult<RemoteDocument> GoogleDriveClient::uploadFile(const std::string& localPath,
                                                           const std::string& displayName,
                                                           const FolderHandle& parent) {
    std::ifstream in(localPath, std::ios::binary);
    if (!in) {
        return RemoteResult<RemoteDocument>::failure(RemoteErrorKind::Permanent, "Cannot read " + localPath);
    }
    std::stringstream content;
    content << in.rdbuf();

    DocumentKind kind = DocumentKind::Other;
    try {
        kind = FormatPolicy::classify(LocalFile::snapshot(localPath));
    } catch (const DocsUploadException& e) {
        return RemoteResult<RemoteDocument>::failure(RemoteErrorKind::Permanent, e.what());
    }

    std::string metadataPayload;
    try {
        json metadata = {
            {"name", displayName},
            {"parents", json::array({rootOrId(parent)})}
        };
        std::string targetType = conversionMimeType(kind);
        if (!targetType.empty()) metadata["mimeType"] = targetType;
        metadataPayload = metadata.dump();
    } catch (const json::exception& e) {
        return RemoteResult<RemoteDocument>::failure(RemoteErrorKind::Permanent, e.what());
    }

    std::string body;
    body += "--" + MULTIPART_BOUNDARY + "\r\n";
    body += "Content-Type: application/json; charset=UTF-8\r\n\r\n";
    body += metadataPayload + "\r\n";
    body += "--" + MULTIPART_BOUNDARY + "\r\n";
    body += "Content-Type: application/octet-stream\r\n\r\n";
    body += content.str() + "\r\n";
    body += "--" + MULTIPART_BOUNDARY + "--";

    HttpResponse response = apiRequest(
        apiUrl("/upload/drive/v3/files?uploadType=multipart&fields=" + urlEncode(FILE_FIELDS)), "POST", body,
        {"Content-Type: multipart/related; boundary=" + MULTIPART_BOUNDARY});
    RemoteError error = toError(response, true);
    if (error.failed()) {
        return RemoteResult<RemoteDocument>::failure(error.kind, error.message);
    }

    RemoteDocument doc;
    doc.title = displayName;
    doc.kind = kind;
    doc.parentId = parent ? parent->id : "";

    // the upload went through; a response we cannot read leaves the local guesses in place
    json uploaded = json::parse(response.body, nullptr, false);
    if (!uploaded.is_discarded() && uploaded.is_object()) {
        if (uploaded.contains("id") && uploaded["id"].is_string()) {
            doc.id = uploaded["id"].get<std::string>();
        }
        if (uploaded.contains("mimeType") && uploaded["mimeType"].is_string()) {
            doc.kind = kindFromMimeType(uploaded["mimeType"].get<std::string>());
        }
    }
    return RemoteResult<RemoteDocument>::success(doc);
}

RemoteError GoogleDriveClient::deleteDocument(const std::string& id) {
    json patch = {{"trashed", true}};
    HttpResponse response = apiRequest(apiUrl("/drive/v3/files/" + urlEncode(id)), "PATCH",
                                       patch.dump(), {"Content-Type: application/json; charset=UTF-8"});
    return toError(response, false);
}

// --- Static helpers ---

DocumentKind GoogleDriveClient::kindFromMimeType(const std::string& mimeType) {
    if (mimeType == Definitions::FOLDER_MIME_TYPE) return DocumentKind::Folder;
    if (mimeType == Definitions::DOCUMENT_MIME_TYPE) return DocumentKind::Document;
    if (mimeType == Definitions::SPREADSHEET_MIME_TYPE) return DocumentKind::Spreadsheet;
    if (mimeType == Definitions::PRESENTATION_MIME_TYPE) return DocumentKind::Presentation;
    if (mimeType == Definitions::PDF_MIME_TYPE) return DocumentKind::Pdf;
    return DocumentKind::Other;
}

std::string GoogleDriveClient::conversionMimeType(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::Document: return Definitions::DOCUMENT_MIME_TYPE;
        case DocumentKind::Spreadsheet: return Definitions::SPREADSHEET_MIME_TYPE;
        case DocumentKind::Presentation: return Definitions::PRESENTATION_MIME_TYPE;
        default: return "";
    }
}

RemoteErrorKind GoogleDriveClient::classifyStatus(long status, bool isUpload) {
    if (status >= 200 && status < 300) return RemoteErrorKind::None;
    if (status == 0 || status == 408 || status == 429 || status >= 500) return RemoteErrorKind::Transient;
    if (status == 401 || status == 403) return RemoteErrorKind::AuthFailure;
    if (isUpload && (status == 400 || status == 413 || status == 415)) return RemoteErrorKind::Permanent;
    return RemoteErrorKind::Transient;
}

std::string GoogleDriveClient::escapeQueryValue(const std::string& value) {
    std::string escaped;
    for (char c : value) {
        if (c == '\'' || c == '\\') escaped += '\\';
        escaped += c;
    }
    return escaped;
}

std::string GoogleDriveClient::childrenQuery(const FolderHandle& parent, bool folders) {
    std::string query = "'" + escapeQueryValue(rootOrId(parent)) + "' in parents and trashed = false and mimeType ";
    query += folders ? "= " : "!= ";
    query += "'" + Definitions::FOLDER_MIME_TYPE + "'";
    return query;
}

std::string GoogleDriveClient::errorMessage(long status, const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error")) {
        const json& error = parsed["error"];
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
        if (error.is_string()) {
            std::string message = error.get<std::string>();
            if (parsed.contains("error_description") && parsed["error_description"].is_string()) {
                message += ": " + parsed["error_description"].get<std::string>();
            }
            return message;
        }
    }
    return "HTTP " + std::to_string(status);
}

} // namespace DocsUpload
