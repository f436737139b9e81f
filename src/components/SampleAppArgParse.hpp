#pragma once

#include "components/BaseArgParse.hpp"
#include "components/PipelineDriver.hpp"

class SampleAppArgParse : public BaseArgParse {
  public:
    explicit SampleAppArgParse(PipelineCmdLine &cmd) : BaseArgParse(cmd) {}
    UnlabeledValueArg<std::string> input{
        "input", "Word list (one entry per line).", true, "", "path", cmd};
    UnlabeledValueArg<std::string> output{
        "output", "Output file, overwritten (- for standard output).", true, "", "path", cmd};
    ValueArg<std::string> source{"s", "source",
        "Draw the sample from this word list instead of the input.", false, "", "path", cmd};
    ValueArg<std::string> count_from{"c", "count-from",
        "Sample as many lines as this file has (default: the input).", false, "", "path", cmd};
    ValueArg<long> sample_size{
        "n", "sample-size", "Number of lines to sample (-1 means all).", false, -1, "int", cmd};
    ValueArg<std::string> prefix{"p", "prefix",
        "Only sample lines starting with this prefix (look -df rules).", false, ".", "string",
        cmd};
    ValueArg<int> seed{
        "r", "seed", "Random seed (-1 means system entropy).", false, -1, "int", cmd};

    PipelineSettings settings() {
        PipelineSettings result;
        result.input = input.getValue();
        result.output = output.getValue();
        result.source = source.getValue();
        result.count_from = count_from.getValue();
        result.prefix = prefix.getValue();
        result.sample_size = sample_size.getValue();
        return result;
    }
};

class ClassifyAppArgParse : public BaseArgParse {
  public:
    explicit ClassifyAppArgParse(PipelineCmdLine &cmd) : BaseArgParse(cmd) {}
    ValueArg<std::string> crk{"k", "crk", "nêhiyawêwin training word list.", false,
        "itwêwina", "path", cmd};
    ValueArg<std::string> eng{
        "e", "eng", "English training word list.", false, "words", "path", cmd};
};
