// -*- C++ -*-
#ifndef _GEOHIL_XTENSORALL_HPP_
#define _GEOHIL_XTENSORALL_HPP_

#include <xtensor/xbuilder.hpp>
#include <xtensor/xmanipulation.hpp>
#include <xtensor/xsort.hpp>
#include <xtensor/xtensor.hpp>

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
#endif
