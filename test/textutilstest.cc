#include <boost/test/unit_test.hpp>
#include <string>
#include <vector>

#include "textutils.hh"
#include "str.hh"

using namespace std;


BOOST_AUTO_TEST_CASE(JoinRange)
{
    vector<string> tokens = { "eu", "te", "amo" };
    BOOST_CHECK_EQUAL( textutils::join(tokens, 0, 3, " "), "eu te amo" );
    BOOST_CHECK_EQUAL( textutils::join(tokens, 1, 3, " "), "te amo" );
    BOOST_CHECK_EQUAL( textutils::join(tokens, 1, 2, " "), "te" );
    BOOST_CHECK_EQUAL( textutils::join(tokens, 2, 2, " "), "" );
}


BOOST_AUTO_TEST_CASE(SplitWordsUnigrams)
{
    vector<string> ngrams = textutils::split_words(1, "this outputs words");
    vector<string> expected = { "this", "outputs", "words" };
    BOOST_CHECK_EQUAL_COLLECTIONS( ngrams.begin(), ngrams.end(),
                                   expected.begin(), expected.end() );
}


BOOST_AUTO_TEST_CASE(SplitWordsBigrams)
{
    vector<string> ngrams = textutils::split_words(2, "this outputs words");
    vector<string> expected = { "this outputs", "outputs words" };
    BOOST_CHECK_EQUAL_COLLECTIONS( ngrams.begin(), ngrams.end(),
                                   expected.begin(), expected.end() );
}


BOOST_AUTO_TEST_CASE(SplitWordsWindowCount)
{
    string sentence("eu acho que isso é muito ruim");
    for (int n=1; n<7; n++) {
        vector<string> ngrams = textutils::split_words(n, sentence);
        BOOST_CHECK_EQUAL( (int)ngrams.size(), 7-n+1 );
        BOOST_CHECK_EQUAL( ngrams.front().find("eu"), 0 );
    }
    vector<string> trigrams = textutils::split_words(3, sentence);
    BOOST_CHECK_EQUAL( trigrams[2], "que isso é" );
    BOOST_CHECK_EQUAL( trigrams.back(), "é muito ruim" );
}


// Sentences with at most n tokens are kept whole
BOOST_AUTO_TEST_CASE(SplitWordsShortSentence)
{
    vector<string> ngrams = textutils::split_words(3, "this outputs words");
    BOOST_CHECK_EQUAL( ngrams.size(), 1 );
    BOOST_CHECK_EQUAL( ngrams[0], "this outputs words" );

    ngrams = textutils::split_words(5, "eu te amo");
    BOOST_CHECK_EQUAL( ngrams.size(), 1 );
    BOOST_CHECK_EQUAL( ngrams[0], "eu te amo" );

    ngrams = textutils::split_words(1, "bolo");
    BOOST_CHECK_EQUAL( ngrams.size(), 1 );
    BOOST_CHECK_EQUAL( ngrams[0], "bolo" );
}


BOOST_AUTO_TEST_CASE(SplitWordsEmptySentence)
{
    vector<string> ngrams = textutils::split_words(1, "");
    BOOST_CHECK_EQUAL( ngrams.size(), 1 );
    BOOST_CHECK_EQUAL( ngrams[0], "" );
}


BOOST_AUTO_TEST_CASE(SplitWordsRepeatedSpaces)
{
    vector<string> ngrams = textutils::split_words(1, "a  b");
    vector<string> expected = { "a", "", "b" };
    BOOST_CHECK_EQUAL_COLLECTIONS( ngrams.begin(), ngrams.end(),
                                   expected.begin(), expected.end() );

    ngrams = textutils::split_words(2, "a  b");
    expected = { "a ", " b" };
    BOOST_CHECK_EQUAL_COLLECTIONS( ngrams.begin(), ngrams.end(),
                                   expected.begin(), expected.end() );

    ngrams = textutils::split_words(1, " leading");
    expected = { "", "leading" };
    BOOST_CHECK_EQUAL_COLLECTIONS( ngrams.begin(), ngrams.end(),
                                   expected.begin(), expected.end() );
}


// Ungrouped splitting keeps every space as a token boundary
BOOST_AUTO_TEST_CASE(SplitWordsMatchesUngroupedSplit)
{
    string sentence("eu  quero ver   queimar");
    vector<string> words = str::split(sentence, " ", false);
    vector<string> ngrams = textutils::split_words(1, sentence);
    BOOST_CHECK_EQUAL( words.size(), 7 );
    BOOST_CHECK_EQUAL_COLLECTIONS( ngrams.begin(), ngrams.end(),
                                   words.begin(), words.end() );
    BOOST_CHECK_EQUAL( textutils::join(ngrams, 0, ngrams.size(), " "), sentence );
}


BOOST_AUTO_TEST_CASE(SplitWordsInvalidSize)
{
    BOOST_CHECK_THROW( textutils::split_words(0, "eu te amo"), string );
    BOOST_CHECK_THROW( textutils::split_words(-1, "eu te amo"), string );
}
