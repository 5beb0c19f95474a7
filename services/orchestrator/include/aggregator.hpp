#pragma once
#include "result_store.hpp"
#include "run_types.hpp"
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

// Final synthesis step: runs the synthesis role once over every succeeded
// result, retried under the same policy as any task.
class Aggregator {
public:
    struct Outcome {
        std::optional<ReportArtifact> report;
        int attempts{0};
        std::vector<FailureRecord> failures; // per attempt, then the terminal aggregation record
    };

    Aggregator(const RoleSpec& synthesis, std::shared_ptr<InferenceClient> client, const RunOptions& options);

    // missing lists failed/skipped roles; they reach the prompt as metadata only.
    Outcome aggregate(const ResultSnapshot& snapshot, const std::vector<OmittedInput>& missing);

private:
    FailureRecord failure(int attempt, ErrorClass cls, const std::string& message) const;

    const RoleSpec& synthesis_;
    std::shared_ptr<InferenceClient> client_;
    RunOptions options_;
    std::mt19937_64 rng_;
};
