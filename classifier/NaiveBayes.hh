#ifndef NAIVE_BAYES_HH
#define NAIVE_BAYES_HH

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "ClassModel.hh"


// Multinomial Naive Bayes over space separated n-grams with add-one smoothing.
// Scores returned by classify are prior * prod P(ngram|class), they are
// not normalized over the classes and are only meaningful for ranking.
// Not thread safe, concurrent training must be serialized by the caller.
class NaiveBayes {
public:
    NaiveBayes(int n_split = 1, int stats = 0);

    void train(const std::string &class_label,
               const std::string &sentence);
    double get_prior(const std::string &class_label) const;
    std::map<std::string, double> classify(const std::string &sentence) const;
    std::string best_class(const std::string &sentence) const;

    const ClassModel& class_model(const std::string &class_label) const;
    bool has_class(const std::string &class_label) const;
    std::vector<std::string> class_labels() const;

    int n_split() const { return m_n_split; }
    double num_documents() const { return m_num_documents; }
    int num_classes() const { return m_classes.size(); }
    int vocabulary_size() const { return m_vocabulary.size(); }
    void set_stats(int stats) { m_stats = stats; }

    void print_config(std::ostream &outf) const;
    void print_stats(std::ostream &outf) const;

private:
    int m_n_split;
    int m_stats;
    double m_num_documents;
    std::map<std::string, ClassModel> m_classes;
    // Occurrence counts over all classes, only the size is used in scoring
    std::map<std::string, double> m_vocabulary;
};

#endif /* NAIVE_BAYES_HH */
