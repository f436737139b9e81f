#pragma once

#include "PipelineComponent.hpp"
#include "global/logging.hpp"

class ConsoleLogger : public PipelineComponent {
    logger_t logger{console_logger("pipeline")};

  public:
    void start() override { logger->debug("Started"); }
    void stage(const std::string& name, std::size_t nb_lines) override {
        logger->debug("Stage {}: {} lines", name, nb_lines);
    }
    void end() override { logger->debug("Ended"); }
};
