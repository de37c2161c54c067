/*=====================================================================
ConPrint.cpp
------------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#include "ConPrint.h"


#include <iostream>


void conPrint(const std::string& s)
{
	std::cout << s << std::endl;
}


void stdErrPrint(const std::string& s)
{
	std::cerr << s << std::endl;
}
