#pragma once

#include "engine/defaults.hpp"
#include "components/content.hpp"

class Engine;

void AssetLoadPlugin(Engine &engine);
void ContentPlugin(Engine &engine);
void DonutPlugin(Engine &engine);
void PanelPlugin(Engine &engine);
