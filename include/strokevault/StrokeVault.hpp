#pragma once

#include <strokevault/core/Config.hpp>
#include <strokevault/core/Error.hpp>
#include <strokevault/core/Geometry.hpp>
#include <strokevault/core/StrokeHandle.hpp>
#include <strokevault/document/Document.hpp>
#include <strokevault/history/HistoryEngine.hpp>
#include <strokevault/input/EditIntent.hpp>
#include <strokevault/render/RenderDispatcher.hpp>
#include <strokevault/store/DocumentStore.hpp>
#include <strokevault/store/Stroke.hpp>
#include <strokevault/task/TaskPool.hpp>
