#pragma once

#include "global/logging.hpp"
#include "tclap/CmdLine.h"

using namespace TCLAP;

class PipelineCmdLine {
    CmdLine cmd;
    int argc;
    char** argv;
    bool already_parsed{false};
    SwitchArg verbose_arg{"v", "verbose", "Debug-level logging.", cmd};

  public:
    template <class... Args>
    PipelineCmdLine(int argc, char* argv[], Args&&... args)
        : cmd(std::forward<Args>(args)...), argc(argc), argv(argv) {}

    void parse() {
        if (!already_parsed) {
            cmd.parse(argc, argv);
            already_parsed = true;
            set_verbose(verbose_arg.getValue());
        }
    }

    // Parse errors become TCLAP::ArgException instead of a message and exit(1)
    void throw_on_error() { cmd.setExceptionHandling(false); }

    bool verbose() { return verbose_arg.getValue(); }

    CmdLine& get() { return cmd; }
};

class BaseArgParse {
  protected:
    CmdLine& cmd;

  public:
    BaseArgParse(PipelineCmdLine& cmd) : cmd(cmd.get()) {}
};
