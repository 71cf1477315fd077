#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace bytebeam::server
{

    std::vector<std::string> load_wordlist(const std::filesystem::path &path);

    const std::vector<std::string> &builtin_wordlist();

    // Expands token templates made of {number}, {word} and {uuid} placeholders.
    class TokenGenerator
    {
    public:
        explicit TokenGenerator(std::vector<std::string> words);

        // Throws std::invalid_argument when the template cannot produce a usable token.
        void validate_format(std::string_view format) const;

        std::string generate(std::string_view format) const;

        std::size_t word_count() const noexcept { return words_.size(); }

    private:
        std::vector<std::string> words_;
    };

} // namespace bytebeam::server
