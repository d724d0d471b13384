/******************************************************************************
 *
 *  Copyright 2024 NXP
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *  http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing, software
 *  distributed under the License is distributed on an "AS IS" BASIS,
 *  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *  See the License for the specific language governing permissions and
 *  limitations under the License.
 *
 ******************************************************************************/
#pragma once

#include "PollingLoopEvent.h"

/*****************************************************************************
**
**  Name:           IPollingLoopListener
**
**  Description:    Upstream target of polling loop notifications. Called on
**                  the thread delivering the native callback.
**
*****************************************************************************/
class IPollingLoopListener {
 public:
  virtual ~IPollingLoopListener() {}

  virtual void onPollingLoopDetected(const PollingLoopEvent& event) = 0;
};
