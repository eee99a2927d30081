#pragma once

#include "oneiros/log.hpp"
#include "oneiros/errors.hpp"
#include "oneiros/types.hpp"
#include "oneiros/config.hpp"
#include "oneiros/network.hpp"
#include "oneiros/scheduler.hpp"
#include "oneiros/clause.hpp"
#include "oneiros/statement.hpp"
#include "oneiros/crypto.hpp"
#include "oneiros/encryption.hpp"
#include "oneiros/session.hpp"
#include "oneiros/rpc.hpp"
#include "oneiros/live.hpp"
#include "oneiros/client.hpp"
