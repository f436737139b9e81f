#include "components/ConsoleLogger.hpp"
#include "components/PipelineDriver.hpp"
#include "components/SampleAppArgParse.hpp"
#include "global/errors.hpp"
#include "global/logging.hpp"
#include "global/random.hpp"

using namespace std;

int main(int argc, char* argv[]) {
    // parsing command-line arguments
    PipelineCmdLine cmd{argc, argv, "Samples random lines of a word list and sorts them "
                                    "case-insensitively.", ' ', "0.1"};
    SampleAppArgParse args(cmd);
    cmd.parse();

    try {
        // random generator
        auto seed = resolve_seed(args.seed.getValue());
        DEBUG("Seed: {}", seed);
        generator_t gen(seed);

        // pipeline and its observers
        PipelineDriver driver(args.settings(), gen);
        ConsoleLogger console_logger;
        driver.add(console_logger);

        auto summary = driver.go();
        DEBUG("Sampled {} of {} candidate lines into {}.", summary.nb_written,
            summary.nb_candidates, driver.get_settings().output);
    } catch (const IOError& e) {
        ERROR("{}", e.what());
        return 1;
    } catch (const InvalidArgument& e) {
        ERROR("{}", e.what());
        return 1;
    }
    return 0;
}
