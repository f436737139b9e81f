#pragma once
#include <string>
#include <utility>
#include <vector>
#include "PipelineComponent.hpp"
#include "global/errors.hpp"
#include "global/random.hpp"
#include "wordlist/case_fold.hpp"
#include "wordlist/line_io.hpp"
#include "wordlist/lookup.hpp"
#include "wordlist/sampler.hpp"

struct PipelineSettings {
    std::string input;
    std::string output;
    //! word list the sample is drawn from (defaults to input)
    std::string source;
    //! file whose line count gives the sample size (defaults to input)
    std::string count_from;
    std::string prefix{"."};
    //! explicit sample size; -1 means "line count of count_from"
    long sample_size{-1};

    // fills in defaults and rejects incompatible options
    void resolve() {
        if (input.empty()) { throw InvalidArgument("No input word list given"); }
        if (output.empty()) { throw InvalidArgument("No output path given"); }
        if (sample_size != -1 and !count_from.empty()) {
            throw InvalidArgument("--sample-size and --count-from cannot be used together");
        }
        if (sample_size < -1) {
            throw InvalidArgument(
                "Sample size must be non-negative (got " + std::to_string(sample_size) + ")");
        }
        if (source.empty()) { source = input; }
        if (count_from.empty()) { count_from = input; }
    }
};

struct PipelineSummary {
    std::size_t sample_size{0};
    std::size_t nb_source_lines{0};
    std::size_t nb_candidates{0};
    std::size_t nb_written{0};
};

class PipelineDriver {
  public:
    PipelineDriver(PipelineSettings settings, generator_t& gen) : settings(settings), gen(gen) {
        this->settings.resolve();
    }

    // count -> read -> lookup -> sample -> sort -> write
    PipelineSummary go() {
        PipelineSummary summary;
        for (auto c : components) c->start();

        long n = settings.sample_size;
        if (n == -1) { n = count_lines(settings.count_from); }
        summary.sample_size = n;
        notify("count", summary.sample_size);

        auto lines = read_lines(settings.source);
        summary.nb_source_lines = lines.size();
        notify("read", lines.size());

        LookupFilter lookup(settings.prefix);
        if (!lookup.matches_all()) { lines = lookup.filter(lines); }
        summary.nb_candidates = lines.size();
        notify("lookup", lines.size());

        auto sample = sample_without_replacement(std::move(lines), n, gen);
        notify("sample", sample.size());

        auto sorted = sort_case_insensitive(std::move(sample));
        notify("sort", sorted.size());

        write_lines(settings.output, sorted);
        summary.nb_written = sorted.size();
        notify("write", sorted.size());

        for (auto c : components) c->end();
        return summary;
    }

    void add(PipelineComponent& component) { components.push_back(&component); }

    const PipelineSettings& get_settings() const { return settings; }

  private:
    void notify(const std::string& stage, std::size_t nb_lines) {
        for (auto c : components) c->stage(stage, nb_lines);
    }

    PipelineSettings settings;
    generator_t& gen;
    std::vector<PipelineComponent*> components;
};
