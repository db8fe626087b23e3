#include "ConflictResolver.h"
#include "FormatPolicy.h"

namespace DocsUpload {

    // === ConsoleDecisionProvider ===

    ConsoleDecisionProvider::ConsoleDecisionProvider(std::istream& in, std::ostream& out)
        : m_in(in), m_out(out) {}

    std::optional<PromptChoice> ConsoleDecisionProvider::parseChoice(const std::string& answer) {
        if (answer == "a") return PromptChoice::AddOnce;
        if (answer == "s") return PromptChoice::SkipOnce;
        if (answer == "r") return PromptChoice::ReplaceOnce;
        if (answer == "aa") return PromptChoice::AddAll;
        if (answer == "sa") return PromptChoice::SkipAll;
        if (answer == "ra") return PromptChoice::ReplaceAll;
        return std::nullopt;
    }

    PromptChoice ConsoleDecisionProvider::choose(const LocalFile&, const RemoteDocument&) {
        std::string answer;
        while (true) {
            m_out << " - add (a) / skip (s) / replace (r) / add all (aa) / skip all (sa) / replace all (ra): ";
            m_out.flush();
            if (!std::getline(m_in, answer)) {
                throw DocsUploadException("Console input closed while waiting for a duplicate decision");
            }
            if (auto choice = parseChoice(answer)) return *choice;
        }
    }

    // === ConflictResolver ===

    ConflictResolver::ConflictResolver(RemoteDocumentStore& store, DecisionProvider& provider,
                                       LoggerCallback logger)
        : m_store(store), m_provider(provider), m_logger(std::move(logger)) {}

    const RemoteDocument* ConflictResolver::findMatch(const LocalFile& file,
                                                      const std::vector<RemoteDocument>& remoteSiblings) {
        DocumentKind kind = FormatPolicy::classify(file);
        for (const auto& doc : remoteSiblings) {
            if (doc.title == file.baseName && doc.kind == kind) {
                return &doc;
            }
        }
        return nullptr;
    }

    ConflictDecision ConflictResolver::resolve(const LocalFile& file,
                                               const std::vector<RemoteDocument>& remoteSiblings,
                                               ConflictPolicy& policy) {
        const RemoteDocument* existing = findMatch(file, remoteSiblings);
        if (!existing) return ConflictDecision::Add;

        // add-all leaves the existing document in place and uploads a second copy
        if (policy.addAll()) return ConflictDecision::Add;
        if (policy.skipAll()) return ConflictDecision::Skip;
        if (policy.replaceAll()) {
            trash(*existing);
            return ConflictDecision::Replace;
        }

        log(" - A document with the same name and type found in Google Docs");
        switch (m_provider.choose(file, *existing)) {
            case PromptChoice::AddOnce:
                return ConflictDecision::Add;
            case PromptChoice::SkipOnce:
                return ConflictDecision::Skip;
            case PromptChoice::ReplaceOnce:
                trash(*existing);
                return ConflictDecision::Replace;
            case PromptChoice::AddAll:
                policy.setAddAll();
                return ConflictDecision::Add;
            case PromptChoice::SkipAll:
                policy.setSkipAll();
                return ConflictDecision::Skip;
            case PromptChoice::ReplaceAll:
                policy.setReplaceAll();
                trash(*existing);
                return ConflictDecision::Replace;
        }
        return ConflictDecision::Skip;
    }

    void ConflictResolver::trash(const RemoteDocument& existing) {
        RemoteError error = m_store.deleteDocument(existing.id);
        if (error.failed()) {
            log(" - Could not move the existing document to the trash: " + error.message);
        }
    }

} // namespace DocsUpload
