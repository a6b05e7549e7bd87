#include "player_resource.h"

PlayerResource::PlayerResource(QObject* parent)
    : QObject(parent)
{
}

PlayerResource::~PlayerResource() = default;
