#pragma once

#include "blockindex/blockindex.hpp"
