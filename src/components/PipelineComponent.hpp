#pragma once

#include <string>

// Observer of a PipelineDriver run; stage() is called once each stage is fully materialized
class PipelineComponent {
  public:
    virtual void start() {}
    virtual void stage(const std::string&, std::size_t) {}
    virtual void end() {}
    virtual ~PipelineComponent() = default;
};
