#include "embedder.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>

namespace semsearch::engine {

    /**
     * Signed feature hashing over lowercased word tokens and their character
     * trigrams. Buckets and signs come from a 64-bit FNV-1a hash seeded per
     * model, so vectors are stable across processes and platforms.
     */
    class HashingEmbedder : public Embedder {
    public:
        explicit HashingEmbedder(EmbeddingModel model)
            : m_model(model), m_dim(model_spec(model).dimension) {
            m_seed = fnv1a(model_spec(model).id, kOffsetBasis);
        }

        std::vector<float> embed(const std::string& text) override {
            std::vector<float> vec(m_dim, 0.0f);
            accumulate(text, vec);
            return vec;
        }

        std::vector<std::vector<float>> embed_many(const std::vector<std::string>& texts) override {
            std::vector<std::vector<float>> out(texts.size(), std::vector<float>(m_dim, 0.0f));
            for (size_t i = 0; i < texts.size(); ++i) {
                accumulate(texts[i], out[i]);
            }
            return out;
        }

        size_t dimension() const override { return m_dim; }
        EmbeddingModel model() const override { return m_model; }
        EmbeddingRuntime runtime() const override { return EmbeddingRuntime::Hashing; }

    private:
        static constexpr std::uint64_t kOffsetBasis = 14695981039346656037ULL;
        static constexpr std::uint64_t kPrime = 1099511628211ULL;
        static constexpr float kWordWeight = 1.0f;
        static constexpr float kTrigramWeight = 0.35f;

        EmbeddingModel m_model;
        size_t m_dim;
        std::uint64_t m_seed;

        static std::uint64_t fnv1a(const std::string& s, std::uint64_t h) {
            for (unsigned char c : s) {
                h ^= c;
                h *= kPrime;
            }
            return h;
        }

        void add_feature(const std::string& feature, float weight, std::vector<float>& vec) const {
            std::uint64_t h = fnv1a(feature, m_seed);
            size_t bucket = static_cast<size_t>(h % m_dim);
            float sign = (h >> 63) ? -1.0f : 1.0f;
            vec[bucket] += sign * weight;
        }

        void add_token(const std::string& token, std::vector<float>& vec) const {
            add_feature(token, kWordWeight, vec);
            std::string padded = "<" + token + ">";
            for (size_t i = 0; i + 3 <= padded.size(); ++i) {
                add_feature("#" + padded.substr(i, 3), kTrigramWeight, vec);
            }
        }

        void accumulate(const std::string& text, std::vector<float>& vec) const {
            std::string token;
            for (char c : text) {
                unsigned char u = static_cast<unsigned char>(c);
                if (std::isalnum(u) || u >= 0x80) {
                    token += static_cast<char>(std::tolower(u));
                } else if (!token.empty()) {
                    add_token(token, vec);
                    token.clear();
                }
            }
            if (!token.empty()) add_token(token, vec);

            float norm = 0.0f;
            for (float v : vec) norm += v * v;
            if (norm > 0.0f) {
                norm = std::sqrt(norm);
                for (float& v : vec) v /= norm;
            }
        }
    };

    std::unique_ptr<Embedder> create_hashing_embedder(EmbeddingModel model) {
        return std::make_unique<HashingEmbedder>(model);
    }

}
