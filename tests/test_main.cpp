// -*- mode: c++ -*-

#define BOOST_TEST_MODULE pdfoutline

#include <boost/test/unit_test.hpp>
