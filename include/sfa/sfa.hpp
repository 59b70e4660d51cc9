#pragma once

#include "agent.hpp"
#include "cancel.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "env.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "invoke.hpp"
#include "output.hpp"
#include "safety.hpp"
#include "server.hpp"
#include "utils.hpp"
