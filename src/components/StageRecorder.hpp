#pragma once

#include <string>
#include <utility>
#include <vector>
#include "PipelineComponent.hpp"

/* Keeps the sequence of stages seen during a run, with their sizes */
class StageRecorder : public PipelineComponent {
    std::vector<std::pair<std::string, std::size_t>> stages_;
    bool started_{false};
    bool ended_{false};

  public:
    void start() final {
        stages_.clear();
        started_ = true;
        ended_ = false;
    }
    void stage(const std::string& name, std::size_t nb_lines) final {
        stages_.emplace_back(name, nb_lines);
    }
    void end() final { ended_ = true; }

    const std::vector<std::pair<std::string, std::size_t>>& stages() const { return stages_; }
    bool started() const { return started_; }
    bool ended() const { return ended_; }

    std::size_t size_of(const std::string& name) const {
        for (auto& s : stages_) {
            if (s.first == name) { return s.second; }
        }
        return 0;
    }
};
