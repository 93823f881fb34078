#ifndef CLASSIFIER_HELPERS_HH
#define CLASSIFIER_HELPERS_HH

#include <istream>
#include <map>
#include <ostream>
#include <string>

#include "NaiveBayes.hh"


// Lines are label<TAB>sentence, returns the number of trained sentences.
int train_corpus(NaiveBayes &nb,
                 std::istream &corpusf);
int train_corpus(NaiveBayes &nb,
                 std::string corpusfname);

void print_scores(std::ostream &outf,
                  const std::map<std::string, double> &class_scores);

#endif /* CLASSIFIER_HELPERS_HH */
