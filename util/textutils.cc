#include <string>
#include <vector>

#include "textutils.hh"
#include "defs.hh"
#include "str.hh"

using namespace std;


namespace textutils {

string
join(const vector<string> &tokens,
     int begin,
     int end,
     const string &sep)
{
    string joined;
    for (int i=begin; i<end; i++) {
        if (i > begin) joined += sep;
        joined += tokens[i];
    }
    return joined;
}


vector<string>
split_words(int size,
            const string &sentence)
{
    if (size < 1) throw string("Invalid n-gram size: " + int2str(size));

    vector<string> words = str::split(sentence, NGRAM_SEPARATOR, false);
    vector<string> ngrams;

    if ((int)words.size() <= size) {
        ngrams.push_back(join(words, 0, words.size(), NGRAM_SEPARATOR));
        return ngrams;
    }

    for (int i=0; i+size <= (int)words.size(); i++)
        ngrams.push_back(join(words, i, i+size, NGRAM_SEPARATOR));

    return ngrams;
}

}
