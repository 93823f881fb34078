#include <fstream>
#include <iostream>

#include "classifier-helpers.hh"
#include "defs.hh"

using namespace std;


int
train_corpus(NaiveBayes &nb,
             istream &corpusf)
{
    string line;
    int linei = 0;
    int num_sentences = 0;
    while (getline(corpusf, line)) {
        linei++;
        if (!line.length()) continue;
        string::size_type sep = line.find(CORPUS_FIELD_SEPARATOR);
        if (sep == string::npos || sep == 0)
            throw string("Invalid corpus line ") + int2str(linei) + ": " + line;
        nb.train(line.substr(0, sep), line.substr(sep+1));
        num_sentences++;
    }
    return num_sentences;
}


int
train_corpus(NaiveBayes &nb,
             string corpusfname)
{
    ifstream corpusf(corpusfname);
    if (!corpusf) throw string("Problem opening corpus file: ") + corpusfname;
    cerr << "Reading corpus: " << corpusfname << endl;
    int num_sentences = train_corpus(nb, corpusf);
    cerr << "Trained sentences: " << num_sentences << endl;
    corpusf.close();
    return num_sentences;
}


void
print_scores(ostream &outf,
             const map<string, double> &class_scores)
{
    for (auto csit = class_scores.begin(); csit != class_scores.end(); ++csit)
        outf << csit->first << " " << csit->second << endl;
}
