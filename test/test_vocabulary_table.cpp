#include <catch2/catch.hpp>
#include "../include/vocabulary_table.hpp"
#include "../include/tokenizer_errors.hpp"
#include <string>
#include <vector>

namespace {

VocabularyEntries special_entries() {
    return {{"[PAD]", 0}, {"[MASK]", 1}, {"[UNK]", 2}, {"[EOS]", 3}, {"[NOAGENT]", 4}};
}

}  // namespace

TEST_CASE("Vocabulary table resolves special token ids") {
    VocabularyEntries entries = special_entries();
    entries.emplace_back("C", 5);
    VocabularyTable table(entries);

    REQUIRE(table.pad_id() == 0);
    REQUIRE(table.mask_id() == 1);
    REQUIRE(table.unk_id() == 2);
    REQUIRE(table.eos_id() == 3);
    REQUIRE(table.noagent_id() == 4);
    REQUIRE(table.size() == 6);
}

TEST_CASE("Construction fails when a special token is missing") {
    const std::vector<std::string> required = {"[PAD]", "[MASK]", "[UNK]", "[EOS]", "[NOAGENT]"};

    for (const auto& missing : required) {
        VocabularyEntries entries;
        for (const auto& entry : special_entries()) {
            if (entry.first != missing) {
                entries.push_back(entry);
            }
        }
        entries.emplace_back("C", 10);

        try {
            VocabularyTable table(entries);
            FAIL("expected MissingSpecialTokenError for " << missing);
        } catch (const MissingSpecialTokenError& e) {
            CHECK(e.token() == missing);
            CHECK(std::string(e.what()) == missing + " token is missing in vocabulary!");
        }
    }
}

TEST_CASE("Lookups fall back to the unknown token") {
    VocabularyEntries entries = special_entries();
    entries.emplace_back("Cl", 7);
    VocabularyTable table(entries);

    REQUIRE(table.lookup_id("Cl") == 7);
    REQUIRE(table.lookup_id("Xe") == table.unk_id());
    REQUIRE(table.lookup_token(7) == "Cl");
    REQUIRE(table.lookup_token(999) == "[UNK]");
    REQUIRE(table.lookup_token(-1) == "[UNK]");
    REQUIRE(table.contains("Cl"));
    REQUIRE_FALSE(table.contains("cl"));
    REQUIRE(table.require("Cl") == 7);
    REQUIRE_THROWS_AS(table.require("Xe"), MissingSpecialTokenError);
}

TEST_CASE("Shared ids keep the last token in source order") {
    VocabularyEntries entries = special_entries();
    entries.emplace_back("A", 9);
    entries.emplace_back("B", 9);
    VocabularyTable table(entries);

    REQUIRE(table.lookup_token(9) == "B");
    REQUIRE(table.lookup_id("A") == 9);
    REQUIRE(table.lookup_id("B") == 9);
    // Size counts token strings, not distinct ids
    REQUIRE(table.size() == 7);

    VocabularyEntries reversed = special_entries();
    reversed.emplace_back("B", 9);
    reversed.emplace_back("A", 9);
    REQUIRE(VocabularyTable(reversed).lookup_token(9) == "A");
}

TEST_CASE("Repeated token takes the later id") {
    VocabularyEntries entries = special_entries();
    entries.emplace_back("X", 7);
    entries.emplace_back("Y", 8);
    entries.emplace_back("X", 8);
    VocabularyTable table(entries);

    REQUIRE(table.size() == 7);
    REQUIRE(table.lookup_id("X") == 8);
    // X stays ahead of Y, so Y is written last for id 8
    REQUIRE(table.lookup_token(8) == "Y");
    REQUIRE(table.lookup_token(7) == "[UNK]");
    REQUIRE(table.tokens().size() == 7);
    REQUIRE(table.tokens()[5] == "X");
}

TEST_CASE("Table can be built from an unordered map") {
    std::unordered_map<std::string, int> token_to_id = {
        {"[PAD]", 10}, {"[MASK]", 11}, {"[UNK]", 12}, {"[EOS]", 13}, {"[NOAGENT]", 14}, {"O", 20}};
    VocabularyTable table(token_to_id);

    REQUIRE(table.size() == token_to_id.size());
    REQUIRE(table.pad_id() == 10);
    REQUIRE(table.lookup_token(20) == "O");
}
