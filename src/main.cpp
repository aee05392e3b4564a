#include "../include/config.hpp"
#include "../include/logger.hpp"
#include "../include/reaction_tokenizer.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_tokens(const std::vector<std::string>& tokens) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        std::cout << (i == 0 ? "" : " ") << "'" << tokens[i] << "'";
    }
    std::cout << std::endl;
}

void print_ids(const std::vector<int>& ids) {
    for (int id : ids) {
        std::cout << id << " ";
    }
    std::cout << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "config/tokenizer_config.json";

    try {
        TokenizerConfig config;
        config.load_from_json(config_path);
        apply_logging(config);

        Logger& logger = Logger::getInstance();
        logger.log("Loading vocabulary from: " + config.vocab_path);

        ReactionTokenizer tokenizer = ReactionTokenizer::from_file(config.vocab_path);
        tokenizer.set_log_unknown_tokens(config.log_unknown_tokens);
        std::cout << "Vocabulary size: " << tokenizer.vocab_size() << std::endl;

        const std::vector<std::string> test_cases = {
            "CCO>NaOH>CCCBr 2.12.13",
            "CCO>>CCCBr 1.5.2",
            "C[N+](C)(C)C.Cl 3.1.1"
        };

        for (const auto& input : test_cases) {
            std::cout << "\nInput: '" << input << "'" << std::endl;

            std::cout << "SMILES tokens: ";
            print_tokens(tokenizer.tokenize_smiles(input.substr(0, input.find(' '))));

            auto ids = tokenizer.encode(input);
            std::cout << "Token IDs: ";
            print_ids(ids);

            std::cout << "Decoded: '" << tokenizer.decode(ids) << "'" << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
