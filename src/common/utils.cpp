#include "common/utils.hpp"
#include <algorithm>
#include <cctype>

namespace codebox {
using namespace std;

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), [](unsigned char c) { return isdigit(c); });
}

elapsed_time::elapsed_time() {
    start = clock::now();
}

double elapsed_time::seconds() const {
    return chrono::duration<double>(clock::now() - start).count();
}

}  // namespace codebox
