#include "judge/language.hpp"
#include <boost/throw_exception.hpp>
#include "common/exceptions.hpp"

namespace codejudge {
using namespace std;

// clang-format off
static const vector<language> language_table = {
    {1, "Python", "3.11.1", ".py", nullopt, "/usr/local/bin/python3", "python"},
    {2, "C++", "9.2.0", ".cpp", "g++ -o {executable} {source}", "./{executable}", "cpp"},
    {3, "Java", "13.0.1", ".java", "javac {source}", "java {class_name}", "java"}
};
// clang-format on

const language *find_language(int language_id) {
    for (auto &lang : language_table)
        if (lang.id == language_id) return &lang;
    return nullptr;
}

const language &get_language(int language_id) {
    const language *lang = find_language(language_id);
    if (!lang) BOOST_THROW_EXCEPTION(unsupported_language(language_id));
    return *lang;
}

const vector<language> &languages() {
    return language_table;
}

}  // namespace codejudge
