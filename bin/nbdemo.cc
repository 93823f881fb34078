#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include "NaiveBayes.hh"
#include "classifier-helpers.hh"

using namespace std;


const string training_corpus =
    "bom\teu te adoro\n"
    "bom\teu te amo\n"
    "bom\teu amo batatas fritas\n"
    "bom\teu amo bolo\n"
    "bom\tvoce é demais\n"
    "bom\tbolo que é demais\n"
    "ruim\tpeixe é ruim\n"
    "ruim\teu te odeio\n"
    "ruim\teu quero ver queimar\n"
    "ruim\teu quero é que se exploda\n"
    "ruim\teu acho que isso é muito ruim\n"
    "ruim\todeio ficar parado\n";


int main(int argc, char* argv[])
{
    try {
        NaiveBayes nb(1);

        istringstream corpusf(training_corpus);
        int num_sentences = train_corpus(nb, corpusf);
        cerr << "Trained sentences: " << num_sentences << endl;

        map<string, double> class_scores = nb.classify("nao achei o filme ruim");
        print_scores(cerr, class_scores);

        if (class_scores["bom"] > class_scores["ruim"])
            cout << "bom";
        else
            cout << "ruim";
        cout << flush;

    } catch (string &e) {
        cerr << e << endl;
        return 1;
    }

    return 0;
}
