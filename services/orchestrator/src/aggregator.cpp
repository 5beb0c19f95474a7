#include "../include/aggregator.hpp"
#include "../include/attempt.hpp"
#include "../../../shared/cpp/agent_sdk/include/log.hpp"

Aggregator::Aggregator(const RoleSpec& synthesis, std::shared_ptr<InferenceClient> client, const RunOptions& options)
    : synthesis_(synthesis), client_(std::move(client)), options_(options), rng_(std::random_device{}()) {}

FailureRecord Aggregator::failure(int attempt, ErrorClass cls, const std::string& message) const {
    FailureRecord f;
    f.role = synthesis_.role;
    f.attempt = attempt;
    f.cls = cls;
    f.message = message;
    f.at = std::chrono::system_clock::now();
    return f;
}

Aggregator::Outcome Aggregator::aggregate(const ResultSnapshot& snapshot, const std::vector<OmittedInput>& missing) {
    Outcome out;
    if (snapshot.results.empty()) {
        out.failures.push_back(failure(0, ErrorClass::Aggregation, "no upstream results to synthesise"));
        log_error("aggregator", snapshot.run_id + ": nothing to aggregate");
        return out;
    }

    TaskInput input;
    input.run_id = snapshot.run_id;
    input.role = synthesis_.role;
    input.upstream = snapshot.results;
    input.omitted = missing;

    ClassifiedError last;
    for (;;) {
        input.attempt = ++out.attempts;
        auto started = std::chrono::steady_clock::now();
        try {
            std::string prompt = synthesis_.build_prompt(input);
            InferenceParams params = synthesis_.params;
            params.timeout_ms = (long)options_.task_timeout.count();
            params.cancel_flag = options_.cancel.flag();
            InferenceReply reply = infer_with_deadline(client_, synthesis_.role, prompt, params,
                                                       options_.task_timeout, options_.cancel);
            ReportArtifact report;
            report.run_id = snapshot.run_id;
            report.role = synthesis_.role;
            report.content = synthesis_.parse_response ? synthesis_.parse_response(reply.text)
                                                       : nlohmann::json{{"text", reply.text}};
            report.upstream = snapshot.results;
            report.omitted = missing;
            report.produced_at = std::chrono::system_clock::now();
            report.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            report.attempt = out.attempts;
            out.report = std::move(report);
            log_info("aggregator", snapshot.run_id + ": report produced from " +
                     std::to_string(snapshot.results.size()) + " result(s)");
            return out;
        } catch (...) {
            last = classify(std::current_exception());
        }

        out.failures.push_back(failure(out.attempts, last.cls, last.message));
        if (last.cls == ErrorClass::Cancelled || !options_.retry.should_retry(last.cls, out.attempts)) break;

        auto delay = options_.retry.backoff(out.attempts, rng_);
        log_warn("aggregator", snapshot.run_id + ": attempt " + std::to_string(out.attempts) + " failed (" +
                 to_string(last.cls) + "), retrying in " + std::to_string(delay.count()) + " ms");
        if (options_.cancel.wait_for(delay)) {
            last = {ErrorClass::Cancelled, "run cancelled during backoff"};
            break;
        }
    }

    out.failures.push_back(failure(out.attempts, ErrorClass::Aggregation,
                                   "synthesis failed after " + std::to_string(out.attempts) + " attempt(s): " +
                                   last.message));
    log_error("aggregator", snapshot.run_id + ": " + out.failures.back().message);
    return out;
}
