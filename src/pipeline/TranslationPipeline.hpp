#pragma once

#include "TranslationTypes.hpp"
#include "../content/ContentScanner.hpp"
#include "../content/Document.hpp"
#include "../content/IDocumentStore.hpp"
#include "../translate/ITranslator.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct SiteConfig;

namespace pipeline
{

// Drives one translation run over the content tree: decides which
// (document, locale) units need work, feeds them to the translator, writes
// the generated variants and finally reconciles alternates across every
// sibling set the run touched.
class TranslationPipeline
{
public:
    using DateProvider = std::function<std::string()>;

    // `translator` may be null for dry runs and status queries.
    TranslationPipeline(const SiteConfig& config, content::IDocumentStore& store, translate::ITranslator* translator,
                        DateProvider today = utcToday);

    // Throws PreconditionError when a real run has no API key or no ready
    // translator. Per-unit problems become Failed results instead.
    std::vector<TranslationResult> translate(const TranslateOptions& options);

    std::vector<StatusRow> status() const;

    // Full text of the generated variant of `source` in `target_locale`.
    std::string buildOutput(const content::Document& source, const std::string& target_locale,
                            const translate::Completed& translated) const;

    static std::string utcToday();

private:
    struct Unit
    {
        std::size_t result_index = 0;
        std::size_t document_index = 0;
        std::string target_locale;
        std::string target_path;
        std::uint64_t job_id = 0;
    };

    void checkPreconditions(const TranslateOptions& options) const;
    bool matchesFilter(const content::Document& doc, const std::string& filter) const;
    std::optional<std::string> internalAlternate(const content::Document& doc, const std::string& locale) const;
    translate::TranslationJob makeJob(const content::Document& doc, const std::string& target_locale) const;
    void runUnits(const std::vector<content::Document>& documents, std::vector<Unit>& units,
                  std::vector<TranslationResult>& results, const TranslateOptions& options);
    void finishUnit(const content::Document& source, const Unit& unit, const translate::Completed& completed,
                    TranslationResult& result);
    void syncTouchedSets(const std::vector<content::Document>& documents, const std::vector<Unit>& units,
                         std::vector<TranslationResult>& results);
    bool carriesMetadata(const std::string& path) const;

    const SiteConfig& config_;
    content::IDocumentStore& store_;
    translate::ITranslator* translator_;
    DateProvider today_;
    content::ContentScanner scanner_;
};

} // namespace pipeline
