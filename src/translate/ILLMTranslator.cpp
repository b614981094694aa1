#include "ILLMTranslator.hpp"
#include "../utils/Diagnostics.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <iterator>
#include <chrono>
#include <thread>

namespace translate
{

ILLMTranslator::ILLMTranslator() = default;

ILLMTranslator::~ILLMTranslator()
{
    shutdown();
}

bool ILLMTranslator::init(const BackendConfig& cfg)
{
    shutdown();
    cfg_ = cfg;
    setLastError({});

    const auto validation_error = validateConfig(cfg_);
    if (!validation_error.empty())
    {
        setLastError(validation_error);
        return false;
    }

    onInit();

    max_concurrent_requests_ = cfg_.max_concurrent_requests == 0 ? 1 : cfg_.max_concurrent_requests;
    request_interval_seconds_ = cfg_.request_interval_seconds < 0.0 ? 0.0 : cfg_.request_interval_seconds;
    max_retries_ = cfg_.max_retries < 0 ? 0 : cfg_.max_retries;

    in_flight_.store(0, std::memory_order_relaxed);
    const auto interval = std::chrono::duration<double>(request_interval_seconds_);
    last_request_ = std::chrono::steady_clock::now() -
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(interval);

    running_.store(true, std::memory_order_relaxed);
    for (std::size_t i = 0; i < max_concurrent_requests_; ++i)
        workers_.emplace_back(&ILLMTranslator::workerLoop, this);

    PLOG_INFO << providerName() << " translator ready: model " << cfg_.model << ", " << max_concurrent_requests_
              << " concurrent request(s)";
    return true;
}

bool ILLMTranslator::isReady() const
{
    return running_.load(std::memory_order_relaxed) && hasValidRuntimeConfig();
}

void ILLMTranslator::shutdown()
{
    running_.store(false, std::memory_order_relaxed);
    for (auto& worker : workers_)
    {
        if (worker.joinable())
            worker.join();
    }
    workers_.clear();

    {
        std::lock_guard<std::mutex> lk(q_mtx_);
        std::queue<Job> empty;
        std::swap(queue_, empty);
    }

    {
        std::lock_guard<std::mutex> lk(r_mtx_);
        results_.clear();
    }

    in_flight_.store(0, std::memory_order_relaxed);
}

bool ILLMTranslator::submit(const TranslationJob& request, std::uint64_t& out_id)
{
    if (!isReady())
    {
        setLastError("translator not ready");
        return false;
    }

    if (request.target_locale.empty())
    {
        setLastError("missing target locale");
        return false;
    }

    Job job;
    job.id = next_id_.fetch_add(1, std::memory_order_relaxed);
    job.request = request;
    const auto queued_id = job.id;

    {
        std::lock_guard<std::mutex> lk(q_mtx_);
        queue_.push(std::move(job));
    }

    out_id = queued_id;
    return true;
}

bool ILLMTranslator::drain(std::vector<Completed>& out)
{
    std::lock_guard<std::mutex> lk(r_mtx_);
    if (results_.empty())
        return false;
    std::move(results_.begin(), results_.end(), std::back_inserter(out));
    results_.clear();
    return true;
}

std::string ILLMTranslator::lastError() const
{
    // Workers overwrite the message on failed attempts; hand out a copy.
    std::lock_guard<std::mutex> lk(err_mtx_);
    return last_error_;
}

void ILLMTranslator::setLastError(const std::string& message)
{
    std::lock_guard<std::mutex> lk(err_mtx_);
    last_error_ = message;
}

void ILLMTranslator::workerLoop()
{
    const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(request_interval_seconds_));
    while (running_.load(std::memory_order_relaxed))
    {
        Job job;
        {
            std::lock_guard<std::mutex> lk(q_mtx_);
            if (!queue_.empty())
            {
                job = std::move(queue_.front());
                queue_.pop();
            }
        }

        if (job.id == 0)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        FlightGuard guard(in_flight_);

        bool success = false;
        RequestResult request_result;
        std::string error;
        int attempt = 0;

        while (running_.load(std::memory_order_relaxed))
        {
            if (interval.count() > 0)
            {
                // Reserve the next start slot so concurrent workers stay spaced.
                std::chrono::steady_clock::time_point wait_until;
                {
                    std::lock_guard<std::mutex> lock(rate_mtx_);
                    wait_until = std::max(std::chrono::steady_clock::now(), last_request_ + interval);
                    last_request_ = wait_until;
                }

                const auto now = std::chrono::steady_clock::now();
                if (wait_until > now)
                {
                    std::this_thread::sleep_for(wait_until - now);
                    if (!running_.load(std::memory_order_relaxed))
                        break;
                }
            }

            request_result = performRequest(job);

            if (request_result.success)
            {
                success = true;
                break;
            }

            error = request_result.error_message;
            setLastError(error);

            if (!request_result.retryable || attempt >= max_retries_)
                break;

            ++attempt;
            auto backoff_ms = static_cast<int>(200 * attempt);
            if (request_result.retry_after_seconds > 0.0)
            {
                backoff_ms = std::max(backoff_ms, static_cast<int>(request_result.retry_after_seconds * 1000.0));
            }
            PLOG_DEBUG << providerName() << " retry " << attempt << "/" << max_retries_ << " for job " << job.id
                       << " in " << backoff_ms << "ms";
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        }

        if (success)
        {
            PLOG_DEBUG << providerName() << " translation [" << job.request.source_locale << " -> "
                       << job.request.target_locale << "]: '" << utils::Diagnostics::Preview(job.request.body)
                       << "' -> '" << utils::Diagnostics::Preview(request_result.completed.body) << "'";
            std::lock_guard<std::mutex> lk(r_mtx_);
            results_.push_back(std::move(request_result.completed));
        }
        else
        {
            if (error.empty())
                error = "cancelled";
            PLOG_WARNING << providerName() << " translation failed [" << job.request.source_locale << " -> "
                         << job.request.target_locale << "]: " << error;
            Completed failed;
            failed.id = job.id;
            failed.failed = true;
            failed.error_message = error;
            std::lock_guard<std::mutex> lk(r_mtx_);
            results_.push_back(std::move(failed));
        }
    }
}

void ILLMTranslator::onInit() {}

std::string ILLMTranslator::validateConfig(const BackendConfig&) const
{
    return {};
}

ILLMTranslator::ProviderLimits ILLMTranslator::providerLimits() const
{
    return {};
}

bool ILLMTranslator::hasValidRuntimeConfig() const
{
    return true;
}

bool ILLMTranslator::shouldRetry(const HttpResponse& resp) const
{
    if (!resp.error.empty())
        return true;
    if (resp.status_code == 429)
        return true;
    return resp.status_code >= 500 || resp.status_code == 408 || resp.status_code == 0;
}

void ILLMTranslator::configureSession(const Job& job, SessionConfig& cfg) const
{
    cfg.connect_timeout_ms = 5000;
    cfg.timeout_ms = 45000;
    if (cfg.use_adaptive_timeout)
    {
        const auto hint = cfg.text_length_hint > 0 ? cfg.text_length_hint : job.request.body.size();
        cfg.timeout_ms = helpers::calculate_adaptive_timeout(cfg.timeout_ms, hint);
    }
}


std::string ILLMTranslator::defaultSystemPrompt(const std::string& source_locale, const std::string& target_locale)
{
    std::string prompt = R"(You are a professional translator. Translate from {source_lang} to {target_lang}.

Rules:
- Translate all text naturally and fluently
- Keep markdown formatting exactly as-is
- Keep code blocks, URLs, and component tags unchanged
- Only output the translation, no explanations)";
    replaceAll(prompt, "{source_lang}", source_locale);
    replaceAll(prompt, "{target_lang}", target_locale);
    return prompt;
}

std::string ILLMTranslator::buildUserMessage(const TranslationJob& job)
{
    std::string message;
    if (!job.fields.empty())
    {
        message += "FRONTMATTER:\n";
        for (const auto& [key, value] : job.fields)
            message += key + ": " + value + "\n";
        message += "\nCONTENT:\n";
    }
    message += job.body;
    return message;
}

ILLMTranslator::Prompt ILLMTranslator::buildPrompt(const Job& job) const
{
    std::string system_prompt = !job.request.prompt_override.empty() ? job.request.prompt_override : cfg_.prompt;
    if (system_prompt.empty())
    {
        system_prompt = defaultSystemPrompt(job.request.source_locale, job.request.target_locale);
    }
    else
    {
        replaceAll(system_prompt, "{source_lang}", job.request.source_locale);
        replaceAll(system_prompt, "{target_lang}", job.request.target_locale);
    }

    Prompt prompt;
    prompt.messages.push_back({ Role::System, std::move(system_prompt) });
    prompt.messages.push_back({ Role::User, buildUserMessage(job.request) });
    return prompt;
}

void ILLMTranslator::replaceAll(std::string& target, const std::string& placeholder, const std::string& value)
{
    if (placeholder.empty())
        return;
    size_t pos = 0;
    while ((pos = target.find(placeholder, pos)) != std::string::npos)
    {
        target.replace(pos, placeholder.length(), value);
        pos += value.length();
    }
}

ILLMTranslator::RequestResult ILLMTranslator::performRequest(const Job& job)
{
    RequestResult result;

    auto prompt = buildPrompt(job);
    const std::string& user_message = prompt.messages.back().content;

    const auto limits = providerLimits();
    if (limits.max_input_bytes > 0)
    {
        auto length_check = helpers::check_text_length(user_message, limits.max_input_bytes, providerName());
        if (!length_check.ok)
        {
            result.error_message = length_check.error_message;
            return result;
        }
    }

    nlohmann::json body_json = nlohmann::json::object();
    buildRequestBody(job, prompt, body_json);
    std::string body = body_json.dump();
    PLOG_VERBOSE << "final post body: " << utils::Diagnostics::Preview(body);

    std::vector<Header> headers;
    buildHeaders(job, headers);

    SessionConfig session_cfg;
    session_cfg.cancel_flag = &running_;
    session_cfg.text_length_hint = user_message.size();
    configureSession(job, session_cfg);

    const auto url = buildUrl(job);
    const auto response = translate::post_json(url, body, headers, session_cfg);

    if (!response.error.empty() || response.status_code < 200 || response.status_code >= 300)
    {
        auto err_type = helpers::categorize_http_error(response.status_code, response.error);
        const std::string snippet = !response.error.empty() ? response.error : response.text;
        result.error_message = helpers::get_error_description(err_type, response.status_code, snippet);
        result.retryable = shouldRetry(response);
        if (response.status_code == 429 || response.status_code == 503)
            result.retry_after_seconds = response.retry_after_seconds;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Translation,
                                            std::string(providerName()) + " request failed", result.error_message);
        return result;
    }

    Completed completed;
    completed.id = job.id;
    completed.failed = false;

    auto parse = parseResponse(job, response, completed);
    if (!parse.ok)
    {
        result.error_message = parse.error_message.empty() ? "parse error" : parse.error_message;
        result.retryable = parse.retryable;
        result.retry_after_seconds = parse.retry_after_seconds;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Translation,
                                            std::string(providerName()) + " response parse failed",
                                            result.error_message);
        return result;
    }

    result.success = true;
    result.completed = std::move(completed);
    return result;
}

} // namespace translate
