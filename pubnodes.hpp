#pragma once

#include <pubnodes/config_file.hpp>
#include <pubnodes/error.hpp>
#include <pubnodes/log.hpp>
#include <pubnodes/node_configuration.hpp>
#include <pubnodes/node_id.hpp>
#include <pubnodes/nodes_file.hpp>
#include <pubnodes/options.hpp>
#include <pubnodes/persister.hpp>
#include <pubnodes/session.hpp>
#include <pubnodes/state.hpp>
