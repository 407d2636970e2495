#include "store/submission_store.hpp"

namespace codejudge::store {

submission_store::~submission_store() = default;

}  // namespace codejudge::store
