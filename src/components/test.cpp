#include "doctest.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include "ConsoleLogger.hpp"
#include "PipelineDriver.hpp"
#include "SampleAppArgParse.hpp"
#include "StageRecorder.hpp"

using namespace std;

namespace {
    void write_file(const string& name, const vector<string>& lines) {
        ofstream os(name, ios_base::trunc);
        for (auto& l : lines) { os << l << "\n"; }
    }

    struct Argv {
        vector<char*> argv;
        explicit Argv(const vector<string>& args) {
            for (auto& a : args) {
                argv.push_back(static_cast<char*>(malloc(sizeof(char) * a.size() + 1)));
                strcpy(argv.back(), a.c_str());
            }
        }
        ~Argv() {
            for (auto p : argv) { free(p); }
        }
        int argc() const { return argv.size(); }
        char** data() { return argv.data(); }
    };
}  // namespace

/*==================================================================================================
  Pipeline driver
==================================================================================================*/
TEST_CASE("Pipeline sorts the whole word list") {
    write_file("tmp_pipeline_in.txt", {"Wolf", "ant", "Bee", "cat"});
    PipelineSettings settings;
    settings.input = "tmp_pipeline_in.txt";
    settings.output = "tmp_pipeline_out.txt";

    auto gen = make_generator(7);
    PipelineDriver driver(settings, gen);
    ConsoleLogger console_logger;
    driver.add(console_logger);
    auto summary = driver.go();

    vector<string> expected{"ant", "Bee", "cat", "Wolf"};
    CHECK(read_lines("tmp_pipeline_out.txt") == expected);
    CHECK(summary.sample_size == 4);
    CHECK(summary.nb_written == 4);
    remove("tmp_pipeline_in.txt");
    remove("tmp_pipeline_out.txt");
}

TEST_CASE("Pipeline tie order is the post-shuffle order") {
    vector<string> input{"bee", "Bee", "ant", "BEE", "Ant"};
    write_file("tmp_ties_in.txt", input);
    PipelineSettings settings;
    settings.input = "tmp_ties_in.txt";
    settings.output = "tmp_ties_out.txt";

    auto gen = make_generator(11);
    PipelineDriver(settings, gen).go();

    auto replay = make_generator(11);
    auto expected = sort_case_insensitive(sample_without_replacement(input, 5, replay));
    auto output = read_lines("tmp_ties_out.txt");
    CHECK(output == expected);
    CHECK(is_permutation(output.begin(), output.end(), input.begin()));
    for (size_t i = 1; i < output.size(); i++) {
        CHECK(fold_case(output[i - 1]) <= fold_case(output[i]));
    }
    remove("tmp_ties_in.txt");
    remove("tmp_ties_out.txt");
}

TEST_CASE("Pipeline on an empty word list") {
    write_file("tmp_empty_in.txt", {});
    write_file("tmp_empty_out.txt", {"stale"});
    PipelineSettings settings;
    settings.input = "tmp_empty_in.txt";
    settings.output = "tmp_empty_out.txt";

    auto gen = make_generator();
    StageRecorder recorder;
    PipelineDriver driver(settings, gen);
    driver.add(recorder);
    driver.go();

    CHECK(read_lines("tmp_empty_out.txt").empty());
    CHECK(count_lines("tmp_empty_out.txt") == 0);
    CHECK(recorder.started());
    CHECK(recorder.ended());
    CHECK(recorder.stages().size() == 6);
    remove("tmp_empty_in.txt");
    remove("tmp_empty_out.txt");
}

TEST_CASE("Pipeline with a separate source and counted file") {
    write_file("tmp_dict.txt", {"apple", "Banana", "cherry", "date", "Elder", "fig", "grape"});
    write_file("tmp_counted.txt", {"a", "b", "c"});
    PipelineSettings settings;
    settings.input = "tmp_counted.txt";
    settings.source = "tmp_dict.txt";
    settings.output = "tmp_source_out.txt";

    auto gen = make_generator(5);
    StageRecorder recorder;
    PipelineDriver driver(settings, gen);
    driver.add(recorder);
    auto summary = driver.go();

    auto output = read_lines("tmp_source_out.txt");
    CHECK(output.size() == 3);
    CHECK(is_sorted(output.begin(), output.end(), case_insensitive_less));
    auto dict = read_lines("tmp_dict.txt");
    for (auto& w : output) { CHECK(find(dict.begin(), dict.end(), w) != dict.end()); }
    CHECK(summary.nb_source_lines == 7);
    CHECK(recorder.size_of("count") == 3);
    CHECK(recorder.size_of("read") == 7);
    CHECK(recorder.size_of("write") == 3);
    remove("tmp_dict.txt");
    remove("tmp_counted.txt");
    remove("tmp_source_out.txt");
}

TEST_CASE("Pipeline with a lookup prefix") {
    write_file("tmp_prefix_in.txt", {"cat", "Cow", "ant", "c-at", "dog"});
    PipelineSettings settings;
    settings.input = "tmp_prefix_in.txt";
    settings.output = "tmp_prefix_out.txt";
    settings.prefix = "c";
    settings.sample_size = 3;

    auto gen = make_generator(9);
    PipelineDriver(settings, gen).go();
    auto output = read_lines("tmp_prefix_out.txt");
    vector<string> candidates{"cat", "c-at", "Cow"};
    CHECK(output.size() == 3);
    CHECK(is_permutation(output.begin(), output.end(), candidates.begin()));

    // full line count exceeds the number of lines starting with "c"
    settings.sample_size = -1;
    auto gen2 = make_generator(9);
    CHECK_THROWS_AS(PipelineDriver(settings, gen2).go(), InvalidArgument);
    remove("tmp_prefix_in.txt");
    remove("tmp_prefix_out.txt");
}

TEST_CASE("Pipeline errors") {
    auto gen = make_generator(1);
    PipelineSettings missing;
    missing.input = "does/not/exist.txt";
    missing.output = "tmp_never_written.txt";
    CHECK_THROWS_AS(PipelineDriver(missing, gen).go(), FileNotFound);

    PipelineSettings conflicting;
    conflicting.input = "in.txt";
    conflicting.output = "out.txt";
    conflicting.count_from = "other.txt";
    conflicting.sample_size = 2;
    CHECK_THROWS_AS(PipelineDriver(conflicting, gen), InvalidArgument);

    PipelineSettings no_output;
    no_output.input = "in.txt";
    CHECK_THROWS_AS(PipelineDriver(no_output, gen), InvalidArgument);
}

/*==================================================================================================
  Command line
==================================================================================================*/
TEST_CASE("Arg parse test") {
    Argv argv({"test_bin", "-s", "dict.txt", "-r", "19", "-p", "ab", "-v", "in.txt", "out.txt"});
    PipelineCmdLine cmd{argv.argc(), argv.data(), "test_bin", ' ', "0.1"};
    SampleAppArgParse args(cmd);
    cmd.throw_on_error();
    cmd.parse();

    CHECK(args.seed.getValue() == 19);
    CHECK(cmd.verbose() == true);
    auto settings = args.settings();
    settings.resolve();
    CHECK(settings.input == "in.txt");
    CHECK(settings.output == "out.txt");
    CHECK(settings.source == "dict.txt");
    CHECK(settings.count_from == "in.txt");
    CHECK(settings.prefix == "ab");
    CHECK(settings.sample_size == -1);
    set_verbose(false);
}

TEST_CASE("Arg parse defaults") {
    Argv argv({"test_bin", "in.txt", "out.txt"});
    PipelineCmdLine cmd{argv.argc(), argv.data(), "test_bin", ' ', "0.1"};
    SampleAppArgParse args(cmd);
    cmd.throw_on_error();
    cmd.parse();

    CHECK(args.seed.getValue() == -1);
    CHECK(cmd.verbose() == false);
    auto settings = args.settings();
    settings.resolve();
    CHECK(settings.source == "in.txt");
    CHECK(settings.count_from == "in.txt");
    CHECK(settings.prefix == ".");
}

TEST_CASE("Arg parse missing output") {
    Argv argv({"test_bin", "in.txt"});
    PipelineCmdLine cmd{argv.argc(), argv.data(), "test_bin", ' ', "0.1"};
    SampleAppArgParse args(cmd);
    cmd.throw_on_error();
    CHECK_THROWS_AS(cmd.parse(), ArgException);
}
