#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include "semsearch/error.hpp"

namespace semsearch::engine {

    /**
     * @brief Lowercasing WordPiece tokenizer for BERT-style sentence encoders.
     */
    class Tokenizer {
    public:
        explicit Tokenizer(const std::filesystem::path& vocab_path) {
            load_vocab(vocab_path);
            m_cls = lookup("[CLS]", 101);
            m_sep = lookup("[SEP]", 102);
            m_unk = lookup("[UNK]", 100);
            m_pad = lookup("[PAD]", 0);
        }

        std::vector<int64_t> encode(const std::string& text, size_t max_length = 256) const {
            std::vector<int64_t> ids;
            ids.push_back(m_cls);

            std::stringstream ss(to_lower(text));
            std::string word;

            while (ss >> word) {
                word.erase(std::remove_if(word.begin(), word.end(),
                    [](unsigned char c) { return std::ispunct(c) != 0; }), word.end());
                if (word.empty()) continue;

                if (word.length() > 100) {
                    ids.push_back(m_unk);
                } else {
                    append_word(word, ids);
                }

                if (ids.size() >= max_length - 1) break; // Reserve 1 for [SEP]
            }

            if (ids.size() >= max_length) {
                ids.resize(max_length - 1);
            }
            ids.push_back(m_sep);

            return ids;
        }

        int64_t pad_id() const { return m_pad; }
        size_t vocab_size() const { return m_vocab.size(); }

    private:
        std::unordered_map<std::string, int64_t> m_vocab;
        int64_t m_cls = 101;
        int64_t m_sep = 102;
        int64_t m_unk = 100;
        int64_t m_pad = 0;

        void append_word(const std::string& word, std::vector<int64_t>& ids) const {
            std::vector<int64_t> pieces;
            size_t start = 0;

            while (start < word.length()) {
                size_t end = word.length();
                int64_t piece = -1;

                while (start < end) {
                    std::string substr = word.substr(start, end - start);
                    if (start > 0) substr = "##" + substr;

                    auto it = m_vocab.find(substr);
                    if (it != m_vocab.end()) {
                        piece = it->second;
                        break;
                    }
                    end--;
                }

                if (piece == -1) {
                    ids.push_back(m_unk);
                    return;
                }

                pieces.push_back(piece);
                start = end;
            }

            ids.insert(ids.end(), pieces.begin(), pieces.end());
        }

        int64_t lookup(const std::string& token, int64_t fallback) const {
            auto it = m_vocab.find(token);
            return it != m_vocab.end() ? it->second : fallback;
        }

        void load_vocab(const std::filesystem::path& path) {
            std::ifstream file(path);
            if (!file.is_open()) {
                throw Error(ErrorKind::ModelUnavailable, "failed to load vocabulary: " + path.string());
            }
            std::string line;
            int64_t id = 0;
            while (std::getline(file, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                m_vocab[line] = id++;
            }
            if (m_vocab.empty()) {
                throw Error(ErrorKind::ModelUnavailable, "empty vocabulary: " + path.string());
            }
        }

        static std::string to_lower(const std::string& s) {
            std::string data = s;
            std::transform(data.begin(), data.end(), data.begin(),
                [](unsigned char c){ return std::tolower(c); });
            return data;
        }
    };

}
