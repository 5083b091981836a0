#ifndef PLUVIO_DATA_HPP
#define PLUVIO_DATA_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/load" and "/transform"
#include "load/types.hpp"
#include "load/load.hpp"
#include "transform/normalization/minmax.hpp"
#include "dataset.hpp"
#endif // PLUVIO_DATA_HPP
