#include "grep/compiler.hpp"
#include "grep/debug.hpp"
#include "grep/matcher.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

static std::string read_all(std::istream& in){
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

static void trim_trailing_newlines(std::string& s){
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
}

int main(int argc, char* argv[]) {
    // Flush after every std::cout / std::cerr
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    if (argc != 3 && argc != 4) {
        std::cerr << "Usage: " << argv[0] << " -E <Pattern> [file]" << std::endl;
        return 1;
    }

    std::string flag = argv[1];
    std::string pattern = argv[2];

    if (flag != "-E"){
        std::cerr << "Expected first argument to be '-E'" << std::endl;
        return 1;
    }

    try {
        std::string input;
        if (argc == 4) {
            const char* filename = argv[3];
            std::ifstream in(filename);
            if (!in) {
                throw std::runtime_error(std::string("Cannot open file: ") + filename);
            }
            input = read_all(in);
        } else {
            input = read_all(std::cin);
        }
        trim_trailing_newlines(input);
        GREP_DBG_PRINT("Input: \"" << input << "\"");

        grep::Pattern compiled = grep::compile(pattern);

        // every line is matched on its own, like grep
        bool any = false;
        for (std::string_view line : grep::split_lines(input)) {
            if (grep::is_match(compiled, line)) {
                std::cout << line << '\n';
                any = true;
            }
        }
        GREP_DBG_PRINT("Match result: " << any);
        return any ? 0 : 1;
    } catch (const grep::ParseError& e) {
        std::cerr << "Invalid pattern: " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}
