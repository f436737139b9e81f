#include "doctest.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include "DigraphClassifier.hpp"
#include "global/errors.hpp"
#include "utf8.hpp"

using namespace std;

/*==================================================================================================
  UTF-8 and normalization
==================================================================================================*/
TEST_CASE("utf8 decode/encode") {
    string s = "itwêwina ᓀᐦᐃᔭᐍᐏᐣ";
    auto decoded = utf8_decode(s);
    CHECK(decoded.size() == 16);
    CHECK(decoded[3] == 0xEA);
    CHECK(utf8_encode(decoded) == s);

    auto bad = utf8_decode("a\xFF" "b\xC3");
    CHECK(bad == u32string{U'a', replacement_char, U'b', replacement_char});
}

TEST_CASE("to_lower") {
    CHECK(to_lower(U'A') == U'a');
    CHECK(to_lower(U'z') == U'z');
    CHECK(to_lower(0xCA) == 0xEA);  // Ê
    CHECK(to_lower(0xD7) == 0xD7);  // multiplication sign
    CHECK(to_lower(0x100) == 0x101);
    CHECK(to_lower(0x141) == 0x142);
    CHECK(to_lower(0x416) == 0x436);
    CHECK(to_lower(0x1400) == 0x1400);  // syllabics have no case
}

TEST_CASE("normalize_word") {
    CHECK(normalize_word("Tânisi!") == "tanisi");
    CHECK(normalize_word("ÊKOSI?? ") == "ekosi");
    CHECK(normalize_word("nîpin\r") == "nipin");
    CHECK(normalize_word("kôna") == "kona");
    CHECK(normalize_word("Hello") == "hello");
    CHECK(normalize_word("") == "");
    CHECK(normalize_word("!?") == "");
}

/*==================================================================================================
  Digraphs
==================================================================================================*/
TEST_CASE("digraphs_of") {
    CHECK(digraphs_of("").empty());

    auto d = digraphs_of("ab");
    CHECK(d.size() == 3);
    CHECK(d.count({Token::start(), Token::character(U'a')}) == 1);
    CHECK(d.count({Token::character(U'a'), Token::character(U'b')}) == 1);
    CHECK(d.count({Token::character(U'b'), Token::end()}) == 1);

    // repeated digraphs are counted once per word
    CHECK(digraphs_of("aaa").size() == 3);
    CHECK(digraphs_of("ê").size() == 2);
}

TEST_CASE("Token display") {
    CHECK(Token::start().to_string() == "^");
    CHECK(Token::end().to_string() == "$");
    CHECK(Token::character(0xEA).to_string() == "ê");
    Digraph d{Token::start(), Token::character(U'k')};
    CHECK(d.to_string() == "^k");
}

/*==================================================================================================
  Classifier
==================================================================================================*/
namespace {
    DigraphClassifier trained() {
        DigraphClassifier model;
        stringstream crk("nipiy\nmaskwa\nmistik\nnapew\niskwew\nwapos\nmaskisin\nminos\n");
        stringstream eng("the\nthere\nother\nhouse\nthrough\nweather\nlaughter\nthat\n");
        model.count_digraphs(crk, Language::Crk);
        model.count_digraphs(eng, Language::Eng);
        model.prune_features();
        return model;
    }
}  // namespace

TEST_CASE("Occurrence counting and pruning") {
    DigraphClassifier model;
    model.add_word("aa", Language::Crk);
    model.add_word("ab", Language::Eng);
    Digraph start_a{Token::start(), Token::character(U'a')};
    Digraph a_b{Token::character(U'a'), Token::character(U'b')};
    CHECK(model.occurrence(start_a).crk == 1);
    CHECK(model.occurrence(start_a).eng == 1);
    CHECK(model.has_feature(a_b));

    model.prune_features();
    CHECK(model.has_feature(start_a));
    CHECK(!model.has_feature(a_b));
    CHECK(model.num_features() == 1);
}

TEST_CASE("log_prob uses add-one smoothing") {
    DigraphClassifier model;
    model.add_word("ab", Language::Crk);
    model.add_word("ab", Language::Crk);
    model.add_word("ab", Language::Eng);
    Digraph a_b{Token::character(U'a'), Token::character(U'b')};
    // 3 features, total 3 for a_b
    CHECK(model.num_features() == 3);
    CHECK(model.log_prob(a_b, Language::Crk) == doctest::Approx(log(3.0 / 6.0)));
    CHECK(model.log_prob(a_b, Language::Eng) == doctest::Approx(log(2.0 / 6.0)));
    CHECK_THROWS_AS(model.log_prob({Token::start(), Token::end()}, Language::Crk), out_of_range);
}

TEST_CASE("Classification") {
    auto model = trained();
    CHECK(model.classify("maskwa").language == Language::Crk);
    CHECK(model.classify("mistikos").language == Language::Crk);
    CHECK(model.classify("the").language == Language::Eng);
    CHECK(model.classify("thether").language == Language::Eng);

    // nothing known: both log probabilities are 0, ties go to English
    auto unknown = model.classify("");
    CHECK(unknown.log_prob_crk == 0.0);
    CHECK(unknown.log_prob_eng == 0.0);
    CHECK(unknown.language == Language::Eng);
    CHECK(to_string(Language::Crk) == "Crk");
}

TEST_CASE("Training from files") {
    {
        ofstream os("tmp_crk.txt");
        os << "Maskwa!\nmistik\n";
    }
    DigraphClassifier model;
    model.count_digraphs_in_file("tmp_crk.txt", Language::Crk);
    CHECK(model.occurrence({Token::start(), Token::character(U'm')}).crk == 2);
    CHECK_THROWS_AS(model.count_digraphs_in_file("does/not/exist", Language::Eng), FileNotFound);
    remove("tmp_crk.txt");
}
