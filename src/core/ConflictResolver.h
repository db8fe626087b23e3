#pragma once

#include "Common.h"
#include "LocalFile.h"
#include "RemoteDocumentStore.h"
#include <optional>

namespace DocsUpload {

    enum class ConflictDecision {
        Add,
        Skip,
        Replace
    };

    // The six answers offered when a duplicate is found.
    enum class PromptChoice {
        AddOnce,
        SkipOnce,
        ReplaceOnce,
        AddAll,
        SkipAll,
        ReplaceAll
    };

    /**
     * @brief Session-wide duplicate handling overrides.
     *
     * Each flag can only ever be switched on. One instance lives for a
     * single top-level upload and is threaded by reference through the walk.
     */
    class ConflictPolicy {
    public:
        ConflictPolicy(bool addAll = false, bool skipAll = false, bool replaceAll = false)
            : m_addAll(addAll), m_skipAll(skipAll), m_replaceAll(replaceAll) {}

        bool addAll() const { return m_addAll; }
        bool skipAll() const { return m_skipAll; }
        bool replaceAll() const { return m_replaceAll; }

        void setAddAll() { m_addAll = true; }
        void setSkipAll() { m_skipAll = true; }
        void setReplaceAll() { m_replaceAll = true; }

    private:
        bool m_addAll;
        bool m_skipAll;
        bool m_replaceAll;
    };

    /**
     * @brief Supplies an answer when a duplicate is found and no sticky
     * flag applies.
     */
    class DecisionProvider {
    public:
        virtual ~DecisionProvider() = default;
        virtual PromptChoice choose(const LocalFile& file, const RemoteDocument& existing) = 0;
    };

    /**
     * @brief Asks the operator on a text console. Invalid answers re-prompt.
     */
    class ConsoleDecisionProvider : public DecisionProvider {
    public:
        explicit ConsoleDecisionProvider(std::istream& in = std::cin, std::ostream& out = std::cout);

        /**
         * @throws DocsUploadException if the input stream closes before a
         * valid answer is read.
         */
        PromptChoice choose(const LocalFile& file, const RemoteDocument& existing) override;

        static std::optional<PromptChoice> parseChoice(const std::string& answer);

    private:
        std::istream& m_in;
        std::ostream& m_out;
    };

    // Always answers the same way; used for unattended runs.
    class PresetDecisionProvider : public DecisionProvider {
    public:
        explicit PresetDecisionProvider(PromptChoice choice) : m_choice(choice) {}

        PromptChoice choose(const LocalFile&, const RemoteDocument&) override { return m_choice; }

    private:
        PromptChoice m_choice;
    };

    /**
     * @brief Decides whether a local file is added, skipped, or replaces a
     * remote document with the same title and kind.
     */
    class ConflictResolver {
    public:
        ConflictResolver(RemoteDocumentStore& store, DecisionProvider& provider,
                         LoggerCallback logger = nullptr);

        /**
         * @brief Resolves the duplicate situation for @p file.
         *
         * Sticky flags are checked in the order add-all, skip-all, replace-all
         * before the provider is consulted; an "-all" answer sets its flag on
         * @p policy. On Replace the existing document is trashed before this
         * returns; a failed delete is logged and still yields Replace.
         */
        ConflictDecision resolve(const LocalFile& file,
                                 const std::vector<RemoteDocument>& remoteSiblings,
                                 ConflictPolicy& policy);

        /**
         * @brief First sibling whose title equals the file's base name and
         * whose kind equals the file's category. Exact, case-sensitive.
         */
        static const RemoteDocument* findMatch(const LocalFile& file,
                                               const std::vector<RemoteDocument>& remoteSiblings);

    private:
        RemoteDocumentStore& m_store;
        DecisionProvider& m_provider;
        LoggerCallback m_logger;

        void log(const std::string& message) const { emitLine(m_logger, message); }
        void trash(const RemoteDocument& existing);
    };

} // namespace DocsUpload
