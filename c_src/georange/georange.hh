// Licensed under the Apache License, Version 2.0 (the "License"); you may not
// use this file except in compliance with the License. You may obtain a copy of
// the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
// WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
// License for the specific language governing permissions and limitations under
// the License.

#ifndef GEORANGE_HH
#define GEORANGE_HH


#include <stdint.h>

#include <memory>
#include <string>
#include <vector>


#define NS_GEORANGE_BEGIN namespace georange {
#define NS_GEORANGE_END }

#define NS_GEORANGE_CMD_BEGIN namespace cmd {
#define NS_GEORANGE_CMD_END }

#define NS_GEORANGE_GEO_BEGIN namespace geo {
#define NS_GEORANGE_GEO_END }

#define NS_GEORANGE_IO_BEGIN namespace io {
#define NS_GEORANGE_IO_END }


#endif
