#pragma once

#include <trickle/end_of_input.hpp>
#include <trickle/run.hpp>
#include <trickle/scan.hpp>
#include <trickle/text.hpp>
#include <trickle/utf8.hpp>
