#include <iostream>
#include <string>

#include "NaiveBayes.hh"
#include "textutils.hh"
#include "defs.hh"

using namespace std;


NaiveBayes::NaiveBayes(int n_split, int stats)
{
    if (n_split < 1) throw string("Invalid n-gram size: " + int2str(n_split));
    m_n_split = n_split;
    m_stats = stats;
    m_num_documents = 0.0;
}


void
NaiveBayes::train(const string &class_label,
                  const string &sentence)
{
    m_num_documents++;

    ClassModel &model = m_classes[class_label];
    model.m_num_documents++;

    vector<string> ngrams = textutils::split_words(m_n_split, sentence);
    for (auto ngit = ngrams.begin(); ngit != ngrams.end(); ++ngit) {
        m_vocabulary[*ngit]++;
        model.add_word(*ngit);
    }
}


double
NaiveBayes::get_prior(const string &class_label) const
{
    if (m_num_documents == 0.0) throw string(EMPTY_MODEL_ERROR);
    return class_model(class_label).m_num_documents / m_num_documents;
}


map<string, double>
NaiveBayes::classify(const string &sentence) const
{
    map<string, double> class_scores;
    if (m_classes.empty()) return class_scores;

    double vocab_size = (double)m_vocabulary.size();
    vector<string> ngrams = textutils::split_words(m_n_split, sentence);

    for (auto cit = m_classes.begin(); cit != m_classes.end(); ++cit) {
        const ClassModel &model = cit->second;
        double prior = get_prior(cit->first);

        // A repeated n-gram in the query contributes one factor
        map<string, double> ngram_probs;
        for (auto ngit = ngrams.begin(); ngit != ngrams.end(); ++ngit)
            ngram_probs[*ngit] = model.smoothed_probability(*ngit, vocab_size);

        double score = prior;
        for (auto npit = ngram_probs.begin(); npit != ngram_probs.end(); ++npit)
            score *= npit->second;
        class_scores[cit->first] = score;

        if (m_stats > 1)
            for (auto npit = ngram_probs.begin(); npit != ngram_probs.end(); ++npit)
                cerr << "\t" << cit->first << " P(" << npit->first << ") " << npit->second << endl;
        if (m_stats > 0)
            cerr << "class: " << cit->first
                 << " prior: " << prior
                 << " score: " << score << endl;
    }

    return class_scores;
}


string
NaiveBayes::best_class(const string &sentence) const
{
    if (m_classes.empty()) throw string(EMPTY_MODEL_ERROR);

    map<string, double> class_scores = classify(sentence);
    auto best = class_scores.begin();
    for (auto csit = class_scores.begin(); csit != class_scores.end(); ++csit)
        if (csit->second > best->second) best = csit;
    return best->first;
}


const ClassModel&
NaiveBayes::class_model(const string &class_label) const
{
    auto cit = m_classes.find(class_label);
    if (cit == m_classes.end()) throw string(UNKNOWN_CLASS_ERROR + class_label);
    return cit->second;
}


bool
NaiveBayes::has_class(const string &class_label) const
{
    return m_classes.find(class_label) != m_classes.end();
}


vector<string>
NaiveBayes::class_labels() const
{
    vector<string> labels;
    for (auto cit = m_classes.begin(); cit != m_classes.end(); ++cit)
        labels.push_back(cit->first);
    return labels;
}


void
NaiveBayes::print_config(ostream &outf) const
{
    outf << "n_split: " << m_n_split << endl;
    outf << "stats: " << m_stats << endl;
}


void
NaiveBayes::print_stats(ostream &outf) const
{
    outf << "documents: " << m_num_documents << endl;
    outf << "classes: " << m_classes.size() << endl;
    outf << "vocabulary size: " << m_vocabulary.size() << endl;
    for (auto cit = m_classes.begin(); cit != m_classes.end(); ++cit)
        outf << "\t" << cit->first
             << " documents: " << cit->second.m_num_documents
             << " n-grams: " << cit->second.num_words()
             << " distinct n-grams: " << cit->second.m_word_freqs.size()
             << " prior: " << get_prior(cit->first) << endl;
}
