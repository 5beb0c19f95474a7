#pragma once
#include "run_types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Per-role raw input. nullopt means no data exists for the role.
class DataProvider {
public:
    virtual ~DataProvider() = default;
    virtual std::optional<nlohmann::json> load_input(const std::string& role) = 0;
};

// Receives everything a run produces. Storage format is up to the sink.
class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;
    virtual void write_result(const std::string& run_id, const AgentResult& result) = 0;
    virtual void write_report(const std::string& run_id, const ReportArtifact& report) = 0;
    virtual void write_summary(const RunSummary& summary) = 0;
};

// Forwards to every sink in turn.
class FanoutSink : public ArtifactSink {
public:
    explicit FanoutSink(std::vector<std::shared_ptr<ArtifactSink>> sinks) : sinks_(std::move(sinks)) {}

    void write_result(const std::string& run_id, const AgentResult& result) override {
        for (auto& s : sinks_) s->write_result(run_id, result);
    }
    void write_report(const std::string& run_id, const ReportArtifact& report) override {
        for (auto& s : sinks_) s->write_report(run_id, report);
    }
    void write_summary(const RunSummary& summary) override {
        for (auto& s : sinks_) s->write_summary(summary);
    }

private:
    std::vector<std::shared_ptr<ArtifactSink>> sinks_;
};
