#ifndef TEXTUTILS_HH
#define TEXTUTILS_HH

#include <string>
#include <vector>


namespace textutils {

std::string join(const std::vector<std::string> &tokens,
                 int begin,
                 int end,
                 const std::string &sep);

// Space separated n-grams of width size, stride one.
// Sentences with at most size tokens are returned as a single n-gram.
//
// split_words(1, "this outputs words") -> "this", "outputs", "words"
// split_words(2, "this outputs words") -> "this outputs", "outputs words"
std::vector<std::string> split_words(int size,
                                     const std::string &sentence);

}

#endif /* TEXTUTILS_HH */
