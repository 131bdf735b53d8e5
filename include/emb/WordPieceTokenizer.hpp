#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace emb {

// BERT-uncased style tokenizer: basic split (whitespace, ASCII punctuation),
// then greedy longest-match-first WordPiece against vocab.txt
class WordPieceTokenizer {
public:
    // throws faculty::ModelInitializationError
    void load_vocab(const std::string& vocab_path);

    bool loaded() const { return !m_id_to_tok.empty(); }
    size_t vocab_size() const { return m_id_to_tok.size(); }

    // [CLS] ... [SEP], never longer than max_len (max_len >= 2)
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;

    int64_t pad_id() const { return m_pad; }
    int64_t unk_id() const { return m_unk; }
    int64_t cls_id() const { return m_cls; }
    int64_t sep_id() const { return m_sep; }

private:
    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;

    int64_t m_pad = 0;
    int64_t m_unk = 0;
    int64_t m_cls = 0;
    int64_t m_sep = 0;

    // words longer than this map straight to [UNK]
    static constexpr size_t kMaxCharsPerWord = 100;

    static bool is_ws(char c);
    static bool is_punct(char c);

    std::vector<std::string> basic_tokenize(const std::string& text) const;
    void wordpiece(const std::string& word, std::vector<int64_t>& out) const;

    int64_t require_id(const std::string& tok) const;
};

}  // namespace emb
