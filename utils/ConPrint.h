/*=====================================================================
ConPrint.h
----------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include <string>


// Print to stdout, followed by a newline.
void conPrint(const std::string& s);

void stdErrPrint(const std::string& s);
