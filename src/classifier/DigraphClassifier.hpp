#pragma once

#include <iostream>
#include <string>
#include <unordered_map>
#include "digraph.hpp"

enum class Language { Crk, Eng };  // nêhiyawêwin (Plains Cree), English

std::string to_string(Language language);

/* How many words of each language contain a given digraph */
struct Occurrence {
    unsigned int crk{0};
    unsigned int eng{0};

    unsigned int total() const { return crk + eng; }
    unsigned int of(Language language) const { return language == Language::Crk ? crk : eng; }
    void add(Language language) { (language == Language::Crk ? crk : eng)++; }
};

struct Classification {
    Language language;
    double log_prob_crk;
    double log_prob_eng;
};

/**
 * \brief Naive Bayes language classifier over word digraphs
 *
 * Each training word contributes at most one occurrence per distinct digraph. Probabilities use
 * add-one smoothing: P(d|lang) = (count(d, lang) + 1) / (total(d) + number of features).
 */
class DigraphClassifier {
    std::unordered_map<Digraph, Occurrence, DigraphHash> features;

  public:
    void add_word(const std::string& line, Language language);
    void count_digraphs(std::istream& is, Language language);
    void count_digraphs_in_file(const std::string& filename, Language language);

    //! removes digraphs witnessed only once overall
    void prune_features();

    bool has_feature(const Digraph& digraph) const { return features.count(digraph) > 0; }
    const Occurrence& occurrence(const Digraph& digraph) const { return features.at(digraph); }
    std::size_t num_features() const { return features.size(); }

    //! throws std::out_of_range for an unknown digraph
    double log_prob(const Digraph& digraph, Language language) const;

    //! the word must already be normalized; unknown digraphs are skipped
    Classification classify(const std::string& word) const;
};
