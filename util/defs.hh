#ifndef DEFS_HH
#define DEFS_HH

#include <sstream>
#include <string>

#define EMPTY_MODEL_ERROR   "Empty model: no training documents"
#define UNKNOWN_CLASS_ERROR "Unknown class: "

#define NGRAM_SEPARATOR " "
#define CORPUS_FIELD_SEPARATOR '\t'

static std::string int2str(int a)
{
    std::ostringstream temp;
    temp<<a;
    return temp.str();
}


#endif /* DEFS_HH */
