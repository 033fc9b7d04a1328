// Compiles the non header parts of Boost.Process v2 exactly once.
#include <boost/process/v2/src.hpp>
