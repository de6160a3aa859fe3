#pragma once

int cmd_batch(int argc, char** argv);
