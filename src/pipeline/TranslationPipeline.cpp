#include "TranslationPipeline.hpp"

#include "../config/SiteConfig.hpp"
#include "../content/AlternatesSynchronizer.hpp"
#include "../content/FieldPatcher.hpp"
#include "../content/FrontMatter.hpp"
#include "../content/HeaderParser.hpp"
#include "../content/HeaderRewriter.hpp"
#include "../content/LocaleResolver.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <map>
#include <thread>

namespace pipeline
{

namespace
{

const char* const kTranslatableFields[] = { "title", "description" };

bool cancelled(const TranslateOptions& options)
{
    return options.cancel_flag && options.cancel_flag->load(std::memory_order_relaxed);
}

std::string trimmed(const std::string& text)
{
    const char* ws = " \t\r\n";
    const auto first = text.find_first_not_of(ws);
    if (first == std::string::npos)
        return {};
    return text.substr(first, text.find_last_not_of(ws) - first + 1);
}

const std::string* findValue(const content::StringPairs& entries, const std::string& key)
{
    for (const auto& entry : entries)
    {
        if (entry.first == key)
            return &entry.second;
    }
    return nullptr;
}

} // namespace

TranslationPipeline::TranslationPipeline(const SiteConfig& config, content::IDocumentStore& store,
                                         translate::ITranslator* translator, DateProvider today)
    : config_(config)
    , store_(store)
    , translator_(translator)
    , today_(std::move(today))
    , scanner_(config, store)
{
    if (!today_)
        today_ = utcToday;
}

std::string TranslationPipeline::utcToday()
{
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &now);
#else
    gmtime_r(&now, &tm_buf);
#endif
    char buf[16] = {};
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
    return buf;
}

void TranslationPipeline::checkPreconditions(const TranslateOptions& options) const
{
    if (options.dry_run)
        return;

    if (config_.api_key.empty())
    {
        throw PreconditionError("OPENAI_API_KEY not found.\n\n"
                                "Add to .env file:\n"
                                "  OPENAI_API_KEY=sk-...\n\n"
                                "Or set the environment variable, or [translator].api_key in the config file.");
    }

    if (!translator_ || !translator_->isReady())
    {
        std::string detail = translator_ ? translator_->lastError() : "no translator configured";
        throw PreconditionError("Translator is not ready: " + detail);
    }
}

bool TranslationPipeline::matchesFilter(const content::Document& doc, const std::string& filter) const
{
    if (filter.empty())
        return true;
    if (doc.path.find(filter) != std::string::npos)
        return true;
    const auto slash = doc.path.find_last_of('/');
    const std::string name = slash == std::string::npos ? doc.path : doc.path.substr(slash + 1);
    return name.find(filter) != std::string::npos;
}

std::optional<std::string> TranslationPipeline::internalAlternate(const content::Document& doc,
                                                                  const std::string& locale) const
{
    if (!doc.has_header)
        return std::nullopt;

    const auto alternates = content::HeaderView::load(doc.header).alternates(content::kAlternatesKey);
    if (!alternates)
        return std::nullopt;

    const std::string* value = findValue(*alternates, locale);
    if (!value || value->empty() || content::yaml::isAbsoluteUrl(*value))
        return std::nullopt;
    return *value;
}

translate::TranslationJob TranslationPipeline::makeJob(const content::Document& doc,
                                                       const std::string& target_locale) const
{
    translate::TranslationJob job;
    job.source_locale = doc.locale;
    job.target_locale = target_locale;
    job.body = trimmed(doc.body);

    const auto view = content::HeaderView::load(doc.header);
    for (const char* field : kTranslatableFields)
    {
        if (auto value = view.stringField(field))
            job.fields.emplace_back(field, *value);
    }
    return job;
}

std::vector<TranslationResult> TranslationPipeline::translate(const TranslateOptions& options)
{
    checkPreconditions(options);

    const std::vector<content::Document> documents = scanner_.scan();
    std::vector<TranslationResult> results;
    std::vector<Unit> units;

    std::size_t selected = 0;
    for (std::size_t i = 0; i < documents.size(); ++i)
    {
        const auto& doc = documents[i];
        const auto targets = doc.targetLocales(config_);
        if (targets.empty() || !matchesFilter(doc, options.file))
            continue;
        ++selected;

        const std::string base = content::basePath(doc.path, doc.locale, config_);
        for (const auto& locale : targets)
        {
            TranslationResult result;
            result.source = doc.path;
            result.locale = locale;
            result.target = content::targetPath(base, locale, config_);

            if (store_.exists(result.target) && !options.force)
            {
                PLOG_INFO << "Skip: " << result.target << " (exists)";
                result.status = TranslationResult::Status::Skipped;
                result.reason = "exists";
                results.push_back(std::move(result));
                continue;
            }

            if (auto permalink = internalAlternate(doc, locale); permalink && !options.force)
            {
                if (auto existing = scanner_.findByPermalink(locale, *permalink))
                {
                    PLOG_INFO << "Skip: " << result.target << " (" << *permalink << " exists as " << *existing
                              << ")";
                    result.status = TranslationResult::Status::Skipped;
                    result.reason = "permalink exists";
                    results.push_back(std::move(result));
                    continue;
                }
            }

            if (options.dry_run)
            {
                PLOG_INFO << "Would create: " << result.target;
                result.status = TranslationResult::Status::Planned;
                results.push_back(std::move(result));
                continue;
            }

            Unit unit;
            unit.result_index = results.size();
            unit.document_index = i;
            unit.target_locale = locale;
            unit.target_path = result.target;
            units.push_back(std::move(unit));
            results.push_back(std::move(result));
        }
    }

    PLOG_INFO << "Found " << selected << " file(s) to process, " << units.size() << " translation(s) to run";

    if (!units.empty())
        runUnits(documents, units, results, options);

    if (!options.dry_run && config_.update_alternates)
        syncTouchedSets(documents, units, results);

    return results;
}

void TranslationPipeline::runUnits(const std::vector<content::Document>& documents, std::vector<Unit>& units,
                                   std::vector<TranslationResult>& results, const TranslateOptions& options)
{
    const std::size_t window = std::max<std::size_t>(1, config_.max_concurrent_requests);
    std::map<std::uint64_t, std::size_t> pending; // job id -> unit index
    std::size_t next = 0;

    while (true)
    {
        while (next < units.size() && pending.size() < window && !cancelled(options))
        {
            auto& unit = units[next];
            auto& result = results[unit.result_index];
            const auto& source = documents[unit.document_index];

            PLOG_INFO << "Translating: " << source.path << " -> " << unit.target_locale;
            std::uint64_t id = 0;
            if (translator_->submit(makeJob(source, unit.target_locale), id))
            {
                unit.job_id = id;
                pending.emplace(id, next);
            }
            else
            {
                result.status = TranslationResult::Status::Failed;
                result.error = translator_->lastError();
                PLOG_ERROR << "Error: " << result.target << ": " << result.error;
            }
            ++next;
        }

        if (pending.empty())
            break;

        std::vector<translate::Completed> completed;
        if (!translator_->drain(completed))
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        for (const auto& done : completed)
        {
            auto it = pending.find(done.id);
            if (it == pending.end())
            {
                PLOG_WARNING << "Ignoring result for unknown job " << done.id;
                continue;
            }
            const Unit& unit = units[it->second];
            finishUnit(documents[unit.document_index], unit, done, results[unit.result_index]);
            pending.erase(it);
        }
    }

    for (; next < units.size(); ++next)
    {
        auto& result = results[units[next].result_index];
        result.status = TranslationResult::Status::Skipped;
        result.reason = "cancelled";
    }
    if (cancelled(options))
        PLOG_WARNING << "Run cancelled, remaining translations were not started";
}

void TranslationPipeline::finishUnit(const content::Document& source, const Unit& unit,
                                     const translate::Completed& completed, TranslationResult& result)
{
    if (completed.failed)
    {
        result.status = TranslationResult::Status::Failed;
        result.error = completed.error_message.empty() ? "translation failed" : completed.error_message;
        PLOG_ERROR << "Error: " << unit.target_path << ": " << result.error;
        return;
    }

    const std::string output = buildOutput(source, unit.target_locale, completed);
    if (!store_.write(unit.target_path, output))
    {
        result.status = TranslationResult::Status::Failed;
        result.error = "failed to write " + unit.target_path;
        return;
    }

    result.status = TranslationResult::Status::Created;
    PLOG_INFO << "Created: " << unit.target_path;
}

std::string TranslationPipeline::buildOutput(const content::Document& source, const std::string& target_locale,
                                             const translate::Completed& translated) const
{
    content::RewriteRequest request;
    request.private_prefix = content::kPrivatePrefix;
    request.marker_key = content::kMarkerKey;

    for (const char* field : kTranslatableFields)
    {
        const std::string* value = findValue(translated.fields, field);
        if (value && !value->empty())
            request.replacements.emplace_back(field, *value);
        else if (std::string(field) == "description")
            request.replacements.emplace_back(field, std::nullopt);
    }

    const auto permalink = internalAlternate(source, target_locale);
    if (permalink)
        request.replacements.emplace_back("permalink", *permalink);

    request.metadata.key = content::kMetadataKey;
    request.metadata.attributes = {
        { "source", source.path },
        { "hash", source.hash },
        { "model", config_.model },
        { "date", today_() },
    };

    const auto lines = content::HeaderParser::parse(source.header);
    std::string output = content::FrontMatter::compose(content::HeaderRewriter::rewrite(lines, request),
                                                       translated.body);

    // A new variant announces itself in the shared alternates map.
    if (content::HeaderParser::hasField(lines, content::kAlternatesKey))
    {
        auto entries = content::HeaderView::load(source.header).alternates(content::kAlternatesKey);
        if (!entries)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Synchronization,
                                                "Alternates copied unchanged, source header is not readable YAML",
                                                "Path: " + source.path);
        }
        else if (!findValue(*entries, target_locale))
        {
            std::string link;
            if (permalink)
                link = *permalink;
            else if (auto own = content::HeaderView::load(source.header).permalink())
                link = *own;
            else
                link = content::fileStem(content::basePath(source.path, source.locale, config_));

            entries->emplace_back(target_locale, link);
            content::AlternatesSynchronizer ordering(config_, store_);
            const auto patched = content::FieldPatcher::patch(output, content::kAlternatesKey,
                                                              ordering.canonicalOrder(*entries));
            output = patched.text;
        }
    }

    return output;
}

void TranslationPipeline::syncTouchedSets(const std::vector<content::Document>& documents,
                                          const std::vector<Unit>& units, std::vector<TranslationResult>& results)
{
    // base path -> indices of every result belonging to a source in that set
    std::map<std::string, std::vector<std::size_t>> touched;
    for (const auto& unit : units)
    {
        if (results[unit.result_index].status != TranslationResult::Status::Created)
            continue;
        const auto& doc = documents[unit.document_index];
        touched[content::basePath(doc.path, doc.locale, config_)];
    }
    if (touched.empty())
        return;

    for (std::size_t i = 0; i < results.size(); ++i)
    {
        const auto& result = results[i];
        for (const auto& doc : documents)
        {
            if (doc.path != result.source)
                continue;
            auto it = touched.find(content::basePath(doc.path, doc.locale, config_));
            if (it != touched.end())
                it->second.push_back(i);
            break;
        }
    }

    content::AlternatesSynchronizer synchronizer(config_, store_);
    for (const auto& [base, indices] : touched)
    {
        const auto modified = synchronizer.syncBasePath(base);
        if (modified.empty())
            continue;
        PLOG_INFO << "Alternates synchronized for " << base << " (" << modified.size() << " file(s))";
        for (std::size_t index : indices)
            results[index].alternates_updated = modified;
    }
}

bool TranslationPipeline::carriesMetadata(const std::string& path) const
{
    const auto text = store_.read(path);
    if (!text)
        return false;
    const auto fm = content::FrontMatter::split(*text);
    if (!fm)
        return false;
    return content::HeaderParser::hasField(content::HeaderParser::parse(fm->header), content::kMetadataKey);
}

std::vector<StatusRow> TranslationPipeline::status() const
{
    std::vector<StatusRow> rows;
    for (const auto& doc : scanner_.scan())
    {
        const auto targets = doc.targetLocales(config_);
        if (targets.empty())
            continue;

        StatusRow row;
        row.source = doc.path;
        const std::string base = content::basePath(doc.path, doc.locale, config_);
        for (const auto& locale : targets)
        {
            LocaleStatus entry;
            entry.locale = locale;

            const std::string path = content::targetPath(base, locale, config_);
            if (store_.exists(path))
            {
                entry.path = path;
            }
            else if (auto permalink = internalAlternate(doc, locale))
            {
                entry.path = scanner_.findByPermalink(locale, *permalink).value_or(std::string{});
            }

            if (!entry.path.empty())
                entry.state = carriesMetadata(entry.path) ? LocaleStatus::State::Ai : LocaleStatus::State::Exists;
            row.locales.push_back(std::move(entry));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace pipeline
