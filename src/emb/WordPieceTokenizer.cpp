#include "emb/WordPieceTokenizer.hpp"
#include "faculty/Errors.hpp"
#include "text/TextUtil.hpp"
#include <fstream>

namespace emb {

void WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) throw faculty::ModelInitializationError("failed to open vocab: " + vocab_path);

    m_id_to_tok.clear();
    m_tok_to_id.clear();

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        int64_t id = (int64_t)m_id_to_tok.size();
        m_id_to_tok.push_back(line);
        m_tok_to_id.emplace(line, id);
    }
    if (m_id_to_tok.empty()) throw faculty::ModelInitializationError("empty vocab: " + vocab_path);

    m_pad = require_id("[PAD]");
    m_unk = require_id("[UNK]");
    m_cls = require_id("[CLS]");
    m_sep = require_id("[SEP]");
}

int64_t WordPieceTokenizer::require_id(const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    if (it == m_tok_to_id.end()) {
        throw faculty::ModelInitializationError("vocab is missing special token " + tok);
    }
    return it->second;
}

bool WordPieceTokenizer::is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool WordPieceTokenizer::is_punct(char c) {
    unsigned char uc = (unsigned char)c;
    return ((uc >= 33 && uc <= 47) || (uc >= 58 && uc <= 64) ||
            (uc >= 91 && uc <= 96) || (uc >= 123 && uc <= 126));
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> out;
    const std::string s = textutil::to_lower_ascii(text);

    std::string cur;
    auto flush = [&](){
        if (!cur.empty()) { out.push_back(cur); cur.clear(); }
    };

    for (char c : s) {
        if (is_ws(c)) {
            flush();
        } else if (is_punct(c)) {
            flush();
            out.emplace_back(1, c);
        } else {
            cur.push_back(c);
        }
    }
    flush();
    return out;
}

void WordPieceTokenizer::wordpiece(const std::string& word, std::vector<int64_t>& out) const {
    if (word.size() > kMaxCharsPerWord) {
        out.push_back(m_unk);
        return;
    }

    std::vector<int64_t> pieces;
    size_t start = 0;

    while (start < word.size()) {
        size_t end = word.size();
        int64_t found = -1;

        while (end > start) {
            std::string sub = word.substr(start, end - start);
            if (start > 0) sub = "##" + sub;

            auto it = m_tok_to_id.find(sub);
            if (it != m_tok_to_id.end()) {
                found = it->second;
                break;
            }
            --end;
        }

        // any unmatched remainder turns the whole word into [UNK]
        if (found < 0) {
            out.push_back(m_unk);
            return;
        }
        pieces.push_back(found);
        start = end;
    }

    out.insert(out.end(), pieces.begin(), pieces.end());
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    if (max_len < 2) max_len = 2;

    std::vector<int64_t> ids;
    ids.reserve(max_len);
    ids.push_back(m_cls);

    std::vector<int64_t> word_ids;
    for (const auto& w : basic_tokenize(text)) {
        word_ids.clear();
        wordpiece(w, word_ids);
        for (int64_t id : word_ids) {
            if (ids.size() + 1 >= max_len) break; // keep room for [SEP]
            ids.push_back(id);
        }
        if (ids.size() + 1 >= max_len) break;
    }

    ids.push_back(m_sep);
    return ids;
}

}  // namespace emb
