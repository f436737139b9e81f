#include "DigraphClassifier.hpp"
#include <cmath>
#include "global/logging.hpp"
#include "wordlist/line_io.hpp"

std::string to_string(Language language) { return language == Language::Crk ? "Crk" : "Eng"; }

void DigraphClassifier::add_word(const std::string& line, Language language) {
    for (auto& digraph : digraphs_of(normalize_word(line))) { features[digraph].add(language); }
}

void DigraphClassifier::count_digraphs(std::istream& is, Language language) {
    std::string line;
    while (std::getline(is, line)) { add_word(line, language); }
}

void DigraphClassifier::count_digraphs_in_file(const std::string& filename, Language language) {
    auto words = read_lines(filename);
    for (auto& word : words) { add_word(word, language); }
    DEBUG("Trained on {} {} words ({} features so far).", words.size(), to_string(language),
        num_features());
}

void DigraphClassifier::prune_features() {
    auto before = num_features();
    for (auto it = features.begin(); it != features.end();) {
        if (it->second.total() <= 1) {
            it = features.erase(it);
        } else {
            ++it;
        }
    }
    DEBUG("Pruned {} features, {} left.", before - num_features(), num_features());
}

double DigraphClassifier::log_prob(const Digraph& digraph, Language language) const {
    auto& occ = features.at(digraph);
    double numerator = occ.of(language) + 1;
    double denominator = occ.total() + num_features();
    return std::log(numerator) - std::log(denominator);
}

Classification DigraphClassifier::classify(const std::string& word) const {
    Classification result{Language::Eng, 0.0, 0.0};
    for (auto& digraph : digraphs_of(word)) {
        if (!has_feature(digraph)) { continue; }
        result.log_prob_crk += log_prob(digraph, Language::Crk);
        result.log_prob_eng += log_prob(digraph, Language::Eng);
    }
    result.language = result.log_prob_crk > result.log_prob_eng ? Language::Crk : Language::Eng;
    return result;
}
