#include "doctest.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>
#include "case_fold.hpp"
#include "global/errors.hpp"
#include "global/random.hpp"
#include "line_io.hpp"
#include "lookup.hpp"
#include "sampler.hpp"

using namespace std;

namespace {
    string write_tmp(const string& name, const string& contents) {
        ofstream os(name, ios_base::trunc);
        os << contents;
        return name;
    }

    vector<string> numbered(int n) {
        vector<string> result;
        for (int i = 0; i < n; i++) { result.push_back("word" + to_string(i)); }
        return result;
    }
}  // namespace

/*==================================================================================================
  Line counting and reading
==================================================================================================*/
TEST_CASE("count_lines") {
    CHECK(count_lines(write_tmp("tmp_count_a.txt", "a\nb\nc\n")) == 3);
    CHECK(count_lines(write_tmp("tmp_count_b.txt", "a\nb\nc")) == 3);
    CHECK(count_lines(write_tmp("tmp_count_c.txt", "")) == 0);
    CHECK(count_lines(write_tmp("tmp_count_d.txt", "\n\n")) == 2);
    for (auto f : {"tmp_count_a.txt", "tmp_count_b.txt", "tmp_count_c.txt", "tmp_count_d.txt"}) {
        remove(f);
    }
}

TEST_CASE("count_lines agrees with read_lines") {
    string contents = "Wolf\nant\n\nBee\ncat";
    write_tmp("tmp_agree.txt", contents);
    auto lines = read_lines("tmp_agree.txt");
    CHECK(lines.size() == count_lines("tmp_agree.txt"));
    vector<string> expected{"Wolf", "ant", "", "Bee", "cat"};
    CHECK(lines == expected);
    remove("tmp_agree.txt");
}

TEST_CASE("Missing file") {
    CHECK_THROWS_AS(count_lines("does/not/exist.txt"), FileNotFound);
    CHECK_THROWS_AS(read_lines("does/not/exist.txt"), IOError);
}

TEST_CASE("write_lines") {
    write_tmp("tmp_write.txt", "old contents that should disappear\n");
    write_lines("tmp_write.txt", {"ant", "Bee"});
    ifstream is("tmp_write.txt");
    stringstream ss;
    ss << is.rdbuf();
    CHECK(ss.str() == "ant\nBee\n");
    remove("tmp_write.txt");

    stringstream empty;
    write_lines(empty, {});
    CHECK(empty.str() == "");

    CHECK_THROWS_AS(write_lines("does/not/exist/out.txt", {"a"}), IOError);
}

/*==================================================================================================
  Case-insensitive sort
==================================================================================================*/
TEST_CASE("fold_case") {
    CHECK(fold_case("Wolf") == "WOLF");
    CHECK(fold_case("itwêwina") == "ITWêWINA");
    CHECK(case_insensitive_less("ant", "Bee"));
    CHECK(!case_insensitive_less("Bee", "bee"));
    CHECK(!case_insensitive_less("bee", "Bee"));
    // upper-case folding puts '_' after letters, as sort -f does
    CHECK(case_insensitive_less("zebra", "_private"));
}

TEST_CASE("Case-insensitive sort") {
    vector<string> input{"Wolf", "ant", "Bee", "cat"};
    vector<string> expected{"ant", "Bee", "cat", "Wolf"};
    CHECK(sort_case_insensitive(input) == expected);
}

TEST_CASE("Case-insensitive ties keep input order") {
    vector<string> input{"bee", "Bee", "ant"};
    vector<string> expected{"ant", "bee", "Bee"};
    CHECK(sort_case_insensitive(input) == expected);

    vector<string> swapped{"Bee", "bee", "ant"};
    vector<string> expected_swapped{"ant", "Bee", "bee"};
    CHECK(sort_case_insensitive(swapped) == expected_swapped);
}

/*==================================================================================================
  Sampling
==================================================================================================*/
TEST_CASE("Full sample is a permutation") {
    auto gen = make_generator(17);
    auto input = numbered(200);
    auto sample = sample_without_replacement(input, input.size(), gen);
    CHECK(sample.size() == input.size());
    CHECK(is_permutation(sample.begin(), sample.end(), input.begin()));
}

TEST_CASE("Partial sample has no duplicates") {
    auto gen = make_generator(3);
    auto input = numbered(50);
    auto sample = sample_without_replacement(input, 20, gen);
    CHECK(sample.size() == 20);
    sort(sample.begin(), sample.end());
    CHECK(adjacent_find(sample.begin(), sample.end()) == sample.end());
    for (auto& s : sample) { CHECK(find(input.begin(), input.end(), s) != input.end()); }
}

TEST_CASE("Sample keeps duplicated lines") {
    auto gen = make_generator(5);
    vector<string> input{"bee", "bee", "ant"};
    auto sample = sample_without_replacement(input, 3, gen);
    CHECK(count(sample.begin(), sample.end(), "bee") == 2);
    CHECK(count(sample.begin(), sample.end(), "ant") == 1);
}

TEST_CASE("Sample size out of range") {
    auto gen = make_generator(1);
    auto input = numbered(4);
    CHECK_THROWS_AS(sample_without_replacement(input, 5, gen), InvalidArgument);
    CHECK_THROWS_AS(sample_without_replacement(input, -1, gen), InvalidArgument);
    CHECK(sample_without_replacement({}, 0, gen).empty());
    CHECK(sample_without_replacement(input, 0, gen).empty());
}

TEST_CASE("Seeds") {
    auto input = numbered(100);
    auto gen1 = make_generator(42);
    auto gen2 = make_generator(42);
    auto gen3 = make_generator(43);
    auto s1 = sample_without_replacement(input, 100, gen1);
    auto s2 = sample_without_replacement(input, 100, gen2);
    auto s3 = sample_without_replacement(input, 100, gen3);
    CHECK(s1 == s2);
    CHECK(s1 != s3);
    CHECK(s1 != input);

    // consecutive draws from one generator differ too
    auto s4 = sample_without_replacement(input, 100, gen1);
    CHECK(s1 != s4);
}

TEST_CASE("Permutations are uniform") {
    auto gen = make_generator(2018);
    vector<string> input{"a", "b", "c"};
    map<vector<string>, int> counts;
    for (int rep = 0; rep < 6000; rep++) { counts[sample_without_replacement(input, 3, gen)]++; }
    CHECK(counts.size() == 6);
    for (auto& c : counts) {
        CHECK(c.second > 800);
        CHECK(c.second < 1200);
    }
}

/*==================================================================================================
  Lookup
==================================================================================================*/
TEST_CASE("Lookup with look -df rules") {
    LookupFilter all(".");
    CHECK(all.matches_all());
    CHECK(all.matches("anything"));
    CHECK(all.matches(""));

    LookupFilter ab("Ab");
    CHECK(!ab.matches_all());
    CHECK(ab.matches("abc"));
    CHECK(ab.matches("a-bout"));
    CHECK(ab.matches("ABLE"));
    CHECK(!ab.matches("bad"));
    CHECK(!ab.matches("a"));

    vector<string> input{"abc", "bad", "ABLE", "a-bout"};
    vector<string> expected{"abc", "ABLE", "a-bout"};
    CHECK(ab.filter(input) == expected);
    CHECK(all.filter(input) == input);
}
