#ifndef CLASS_MODEL_HH
#define CLASS_MODEL_HH

#include <map>
#include <string>
#include <vector>


// Training statistics for one class label.
class ClassModel {
public:
    ClassModel() : m_num_documents(0.0) { }

    void add_word(const std::string &ngram) {
        m_words.push_back(ngram);
        m_word_freqs[ngram]++;
    }

    double word_frequency(const std::string &ngram) const {
        auto wfit = m_word_freqs.find(ngram);
        if (wfit == m_word_freqs.end()) return 0.0;
        return wfit->second;
    }

    int num_words() const { return m_words.size(); }

    // Add-one smoothed P(ngram|class), vocab_size is the number of
    // distinct n-grams over all classes
    double smoothed_probability(const std::string &ngram, double vocab_size) const {
        return (word_frequency(ngram) + 1.0) / ((double)num_words() + vocab_size);
    }

    // Number of training sentences, only used for the prior
    double m_num_documents;
    // All n-grams from the training sentences, duplicates included
    std::vector<std::string> m_words;
    // Counts of the distinct n-grams
    std::map<std::string, double> m_word_freqs;
};

#endif /* CLASS_MODEL_HH */
