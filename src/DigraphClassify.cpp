#include <cmath>
#include "classifier/DigraphClassifier.hpp"
#include "components/SampleAppArgParse.hpp"
#include "global/errors.hpp"
#include "global/logging.hpp"

using namespace std;

int main(int argc, char* argv[]) {
    PipelineCmdLine cmd{argc, argv,
        "Guesses whether words read on stdin are nêhiyawêwin or English.", ' ', "0.1"};
    ClassifyAppArgParse args(cmd);
    cmd.parse();

    DigraphClassifier model;
    try {
        model.count_digraphs_in_file(args.crk.getValue(), Language::Crk);
        model.count_digraphs_in_file(args.eng.getValue(), Language::Eng);
    } catch (const IOError& e) {
        ERROR("{}", e.what());
        return 1;
    }
    model.prune_features();

    string line;
    while (getline(cin, line)) {
        auto word = normalize_word(line);
        auto guess = model.classify(word);
        cout << "  P(crk|" << word << ") = " << exp(guess.log_prob_crk) << "\n";
        cout << "  P(eng|" << word << ") = " << exp(guess.log_prob_eng) << "\n";
        cout << word << ": " << to_string(guess.language) << "\n";
    }
    return 0;
}
