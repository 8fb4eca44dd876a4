#include <actor-theta/src.hpp>
