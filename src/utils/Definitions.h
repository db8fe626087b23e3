#ifndef DEFINITIONS_H
#define DEFINITIONS_H

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace Definitions {

const std::string APP_NAME = "docs-upload";
const std::string APP_VERSION = "1.3.1";

// --- Upload ---

// Extensions the hosted service accepts for conversion.
const std::vector<std::string> SUPPORTED_FORMATS = {
    "csv", "doc", "docx", "html", "htm", "ods", "odt", "pdf", "ppt",
    "pps", "rtf", "sxw", "tsv", "tab", "txt", "xls", "xlsx"
};

// Extension -> document category
const std::map<std::string, std::string> FORMAT_CATEGORIES = {
    {"doc", "document"}, {"docx", "document"}, {"htm", "document"},
    {"html", "document"}, {"rtf", "document"}, {"sxw", "document"},
    {"txt", "document"}, {"odt", "document"},

    {"csv", "spreadsheet"}, {"ods", "spreadsheet"}, {"tab", "spreadsheet"},
    {"tsv", "spreadsheet"}, {"xls", "spreadsheet"}, {"xlsx", "spreadsheet"},

    {"pps", "presentation"}, {"ppt", "presentation"},

    {"pdf", "pdf"}
};

// Document category -> size ceiling in bytes
const std::map<std::string, std::uintmax_t> SIZE_LIMITS = {
    {"document", 500000},
    {"spreadsheet", 1000000},
    {"presentation", 10000000},
    {"pdf", 10000000}
};

const int DEFAULT_UPLOAD_ATTEMPTS = 3;

// --- Remote endpoints ---

const std::string DEFAULT_PROTOCOL = "https";
const std::string DEFAULT_HOST = "www.googleapis.com";
const std::string DEFAULT_AUTH_PROTOCOL = "https";
const std::string DEFAULT_AUTH_HOST = "oauth2.googleapis.com";

const std::string FOLDER_MIME_TYPE = "application/vnd.google-apps.folder";
const std::string DOCUMENT_MIME_TYPE = "application/vnd.google-apps.document";
const std::string SPREADSHEET_MIME_TYPE = "application/vnd.google-apps.spreadsheet";
const std::string PRESENTATION_MIME_TYPE = "application/vnd.google-apps.presentation";
const std::string PDF_MIME_TYPE = "application/pdf";

// --- Console messages ---

const std::vector<std::string> WELCOME_MESSAGE = {
    "",
    "Docs Upload " + APP_VERSION,
    "Using this tool, you can batch upload your documents to a Google Docs account preserving folder structure.",
    "Supported file formats are: csv, doc, docx, html, htm, ods, odt, pdf, ppt, pps, rtf, sxw, tsv, tab, txt, xls, xlsx.",
    "Type '--help' for a list of parameters.",
    ""
};

const std::vector<std::string> USAGE_MESSAGE = {
    "",
    "Usage: docs-upload",
    "Usage: docs-upload <path> --recursive",
    "Usage: docs-upload <path> --username <username> --password <password>",
    "Usage: docs-upload <path> --auth-sub <token>",
    "    [--username <username>]       Username for a Google account.",
    "    [--password <password>]       Password for a Google account.",
    "    [--recursive]                 Recursively upload all subfolders.",
    "    [--remote-folder]             The remote folder path to upload the documents separated by '/'.",
    "    [--without-folders]           Do not recreate folder structure in Google Docs.",
    "    [--add-all]                   Upload all documents even if there are already documents with the same names.",
    "    [--skip-all]                  Skip all documents if there there are already documents with the same names.",
    "    [--replace-all]               Replace all documents in Google Docs, which have the same names as the uploaded.",
    "    [--disable-retries]           Disable auto-retries in the cases of failed upload.",
    "    [--mark-read-only]            Mark local folders read-only while they are uploaded.",
    "    [--config <file>]             JSON settings file.",
    "    [--auth-sub <token>]          OAuth access token.",
    "    [--auth-protocol <protocol>]  The protocol to use with authentication.",
    "    [--auth-host <host:port>]     The host of the auth server to use.",
    "    [--protocol <protocol>]       The protocol to use with the HTTP requests.",
    "    [--host <host:port>]          Where is the API (default = www.googleapis.com)",
    "",
    "You can also use short versions of the options, such as -u (--username), -p (--password), -rf (--remote-folder), etc."
};

} // namespace Definitions

#endif // DEFINITIONS_H
