#include "../include/scheduler.hpp"
#include "../include/attempt.hpp"
#include "../../../shared/cpp/agent_sdk/include/log.hpp"
#include <algorithm>
#include <thread>

namespace {
std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (const auto& s : v) out += (out.empty() ? "" : ", ") + s;
    return out;
}
}

Scheduler::Scheduler(std::string run_id, const DependencyGraph& graph, const std::vector<RoleSpec>& roles,
                     std::shared_ptr<InferenceClient> client, std::shared_ptr<DataProvider> data,
                     ResultStore& store, const RunOptions& options)
    : run_id_(std::move(run_id)), graph_(graph), client_(std::move(client)), data_(std::move(data)),
      store_(store), options_(options), rng_(std::random_device{}()) {
    if (!client_) throw ConfigurationError("scheduler needs an inference client");
    if (options_.max_concurrent < 1) throw ConfigurationError("max_concurrent must be at least 1");
    for (const auto& spec : roles) specs_[spec.role] = &spec;
    for (const auto& role : graph_.roles()) {
        if (!specs_.count(role)) throw ConfigurationError("no role definition for " + role);
        TaskRecord t;
        t.role = role;
        t.prerequisites = graph_.prerequisites(role);
        tasks_.push_back(std::move(t));
        states_[role] = TaskState::Waiting;
    }
}

void Scheduler::run() {
    log_info("scheduler", run_id_ + ": scheduling " + std::to_string(tasks_.size()) + " task(s), max_concurrent=" +
             std::to_string(options_.max_concurrent));
    CancellationSubscription sub(options_.cancel, [this]{
        std::lock_guard<std::mutex> lock(mtx_);
        cv_.notify_all();
    });

    std::vector<std::thread> workers;
    workers.reserve(options_.max_concurrent);
    for (int i = 0; i < options_.max_concurrent; ++i) workers.emplace_back([this]{ worker_loop(); });
    for (auto& w : workers) w.join();
}

void Scheduler::worker_loop() {
    std::unique_lock<std::mutex> lock(mtx_);
    for (;;) {
        if (options_.cancel.cancelled()) cancel_pending_locked();
        promote_locked();
        if (!pending_transitions_.empty() && !delivering_) {
            deliver_transitions(lock);
            continue;
        }
        if (all_terminal_locked()) {
            cv_.notify_all();
            return;
        }

        auto now = std::chrono::steady_clock::now();
        auto idx = pick_launchable_locked(now);
        if (idx && running_ < options_.max_concurrent) {
            TaskRecord& task = tasks_[*idx];
            ++task.attempts;
            transition_locked(task, TaskState::Running);
            ++running_;
            peak_running_ = std::max(peak_running_, running_);
            TaskInput input = build_input_locked(task);
            const RoleSpec& spec = *specs_.at(task.role);
            log_debug("scheduler", run_id_ + ": " + task.role + " attempt " + std::to_string(task.attempts) + " started");
            std::size_t launched = *idx;
            deliver_transitions(lock);

            lock.unlock();
            AttemptOutcome outcome = execute_attempt(spec, std::move(input));
            lock.lock();

            --running_;
            apply_outcome_locked(launched, std::move(outcome));
            cv_.notify_all();
            continue;
        }

        if (auto next = next_retry_locked()) cv_.wait_until(lock, *next);
        else cv_.wait(lock);
    }
}

bool Scheduler::all_terminal_locked() const {
    return std::all_of(tasks_.begin(), tasks_.end(), [](const TaskRecord& t){ return is_terminal(t.state); });
}

void Scheduler::promote_locked() {
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& role : graph_.ready_set(states_)) {
            TaskRecord& task = tasks_[graph_.index_of(role)];
            auto unmet = graph_.unmet_mandatory(role, states_);
            if (!unmet.empty()) {
                record_failure_locked(task, ErrorClass::DependencyUnmet,
                                      "mandatory prerequisite(s) did not succeed: " + join(unmet));
                transition_locked(task, TaskState::Skipped);
                log_warn("scheduler", run_id_ + ": " + role + " skipped, missing " + join(unmet));
            } else {
                task.omitted = graph_.omitted_optional(role, states_);
                task.retry_at = std::chrono::steady_clock::time_point{};
                transition_locked(task, TaskState::Ready);
            }
            changed = true;
        }
    }
}

void Scheduler::cancel_pending_locked() {
    for (auto& task : tasks_) {
        if (task.state != TaskState::Waiting && task.state != TaskState::Ready) continue;
        record_failure_locked(task, ErrorClass::Cancelled, "run cancelled before the task was launched");
        transition_locked(task, TaskState::Skipped);
    }
}

std::optional<std::size_t> Scheduler::pick_launchable_locked(std::chrono::steady_clock::time_point now) const {
    if (options_.cancel.cancelled()) return std::nullopt;
    std::optional<std::size_t> best;
    int best_pending = -1;
    for (std::size_t i = 0; i < tasks_.size(); ++i) {
        const auto& t = tasks_[i];
        if (t.state != TaskState::Ready || t.retry_at > now) continue;
        int pending = graph_.pending_dependents(t.role, states_);
        if (pending > best_pending) { // strict: earlier declaration wins ties
            best = i;
            best_pending = pending;
        }
    }
    return best;
}

std::optional<std::chrono::steady_clock::time_point> Scheduler::next_retry_locked() const {
    auto now = std::chrono::steady_clock::now();
    std::optional<std::chrono::steady_clock::time_point> next;
    for (const auto& t : tasks_) {
        if (t.state != TaskState::Ready || t.retry_at <= now) continue;
        if (!next || t.retry_at < *next) next = t.retry_at;
    }
    return next;
}

TaskInput Scheduler::build_input_locked(const TaskRecord& task) const {
    TaskInput input;
    input.run_id = run_id_;
    input.role = task.role;
    input.omitted = task.omitted;
    input.attempt = task.attempts;
    for (const auto& role : graph_.roles()) {
        bool is_prereq = std::any_of(task.prerequisites.begin(), task.prerequisites.end(),
                                     [&](const Prerequisite& p){ return p.role == role; });
        if (!is_prereq) continue;
        if (auto r = store_.get(role)) input.upstream.push_back(std::move(*r));
    }
    return input;
}

Scheduler::AttemptOutcome Scheduler::execute_attempt(const RoleSpec& spec, TaskInput input) {
    AttemptOutcome out;
    int attempt = input.attempt;
    auto started = std::chrono::steady_clock::now();
    try {
        if (data_) input.raw = data_->load_input(spec.role);
        if (spec.requires_input && !input.raw) throw InputUnavailableError("no input data for role " + spec.role);

        std::string prompt = spec.build_prompt(input);
        InferenceParams params = spec.params;
        params.timeout_ms = (long)options_.task_timeout.count();
        params.cancel_flag = options_.cancel.flag();
        InferenceReply reply = infer_with_deadline(client_, spec.role, prompt, params, options_.task_timeout,
                                                   options_.cancel);

        out.result.role = spec.role;
        out.result.content = spec.parse_response ? spec.parse_response(reply.text)
                                                 : nlohmann::json{{"text", reply.text}};
        out.result.produced_at = std::chrono::system_clock::now();
        out.result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        out.result.prompt_tokens = reply.prompt_tokens;
        out.result.completion_tokens = reply.completion_tokens;
        out.result.attempt = attempt;
        out.ok = true;
    } catch (...) {
        out.error = classify(std::current_exception());
    }
    return out;
}

void Scheduler::apply_outcome_locked(std::size_t idx, AttemptOutcome outcome) {
    TaskRecord& task = tasks_[idx];

    if (options_.cancel.cancelled()) {
        std::string msg = outcome.ok ? "run cancelled; result discarded" : outcome.error.message;
        record_failure_locked(task, ErrorClass::Cancelled, msg);
        transition_locked(task, TaskState::Skipped);
        return;
    }

    if (outcome.ok) {
        try {
            store_.put(std::move(outcome.result));
        } catch (const DuplicateWriteError& e) {
            record_failure_locked(task, ErrorClass::PermanentInference, e.what());
            transition_locked(task, TaskState::Failed);
            return;
        }
        transition_locked(task, TaskState::Succeeded);
        log_info("scheduler", run_id_ + ": " + task.role + " succeeded (attempt " + std::to_string(task.attempts) + ")");
        return;
    }

    record_failure_locked(task, outcome.error.cls, outcome.error.message);
    if (options_.retry.should_retry(outcome.error.cls, task.attempts)) {
        auto delay = options_.retry.backoff(task.attempts, rng_);
        task.retry_at = std::chrono::steady_clock::now() + delay;
        transition_locked(task, TaskState::Ready);
        log_warn("scheduler", run_id_ + ": " + task.role + " attempt " + std::to_string(task.attempts) + " failed (" +
                 to_string(outcome.error.cls) + "), retrying in " + std::to_string(delay.count()) + " ms: " +
                 outcome.error.message);
        return;
    }
    transition_locked(task, TaskState::Failed);
    log_error("scheduler", run_id_ + ": " + task.role + " failed after " + std::to_string(task.attempts) +
              " attempt(s) (" + to_string(outcome.error.cls) + "): " + outcome.error.message);
}

void Scheduler::transition_locked(TaskRecord& task, TaskState to) {
    TaskState from = task.state;
    task.state = to;
    states_[task.role] = to;
    if (options_.on_transition) pending_transitions_.push_back({task.role, from, to});
}

// One worker at a time drains the queue with the lock released, so the
// observer sees transitions in order and may call back into the scheduler.
void Scheduler::deliver_transitions(std::unique_lock<std::mutex>& lock) {
    if (delivering_) return;
    delivering_ = true;
    while (!pending_transitions_.empty()) {
        std::vector<Transition> batch;
        batch.swap(pending_transitions_);
        lock.unlock();
        for (const auto& t : batch) options_.on_transition(t.role, t.from, t.to);
        lock.lock();
    }
    delivering_ = false;
}

void Scheduler::record_failure_locked(TaskRecord& task, ErrorClass cls, const std::string& message) {
    FailureRecord f;
    f.role = task.role;
    f.attempt = task.attempts;
    f.cls = cls;
    f.message = message;
    f.at = std::chrono::system_clock::now();
    task.failures.push_back(f);
    task.last_error = f;
    failures_.push_back(std::move(f));
}

std::vector<TaskRecord> Scheduler::tasks() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return tasks_;
}

std::vector<FailureRecord> Scheduler::failures() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return failures_;
}

int Scheduler::peak_concurrency() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return peak_running_;
}
