/* SPDX-License-Identifier: MIT */
/*
 * Homelab Test Runner
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
