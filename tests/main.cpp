// Created by block on 2026-10-19.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
