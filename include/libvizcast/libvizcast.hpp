// Created by block on 2026-10-19.

#pragma once

#include <libvizcast/BatchRunner.hpp>
#include <libvizcast/CoverResolver.hpp>
#include <libvizcast/EncodePipeline.hpp>
#include <libvizcast/EngineRunner.hpp>
#include <libvizcast/Error.hpp>
#include <libvizcast/FilterGraph.hpp>
#include <libvizcast/MediaProbe.hpp>
#include <libvizcast/ScratchFile.hpp>
#include <libvizcast/Subprocess.hpp>
#include <libvizcast/Visualization.hpp>
