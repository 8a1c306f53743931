//
// Opcode values of all documented 8080 instructions.
//

#ifndef I8080_OPCODES_HPP
#define I8080_OPCODES_HPP

enum i8080_opcode : unsigned char
{
    i8080_NOP        = 0x00,
    i8080_LXI_B      = 0x01,
    i8080_STAX_B     = 0x02,
    i8080_INX_B      = 0x03,
    i8080_INR_B      = 0x04,
    i8080_DCR_B      = 0x05,
    i8080_MVI_B      = 0x06,
    i8080_RLC        = 0x07,
    i8080_DAD_B      = 0x09,
    i8080_LDAX_B     = 0x0A,
    i8080_DCX_B      = 0x0B,
    i8080_INR_C      = 0x0C,
    i8080_DCR_C      = 0x0D,
    i8080_MVI_C      = 0x0E,
    i8080_RRC        = 0x0F,
    i8080_LXI_D      = 0x11,
    i8080_STAX_D     = 0x12,
    i8080_INX_D      = 0x13,
    i8080_INR_D      = 0x14,
    i8080_DCR_D      = 0x15,
    i8080_MVI_D      = 0x16,
    i8080_RAL        = 0x17,
    i8080_DAD_D      = 0x19,
    i8080_LDAX_D     = 0x1A,
    i8080_DCX_D      = 0x1B,
    i8080_INR_E      = 0x1C,
    i8080_DCR_E      = 0x1D,
    i8080_MVI_E      = 0x1E,
    i8080_RAR        = 0x1F,
    i8080_LXI_H      = 0x21,
    i8080_SHLD       = 0x22,
    i8080_INX_H      = 0x23,
    i8080_INR_H      = 0x24,
    i8080_DCR_H      = 0x25,
    i8080_MVI_H      = 0x26,
    i8080_DAA        = 0x27,
    i8080_DAD_H      = 0x29,
    i8080_LHLD       = 0x2A,
    i8080_DCX_H      = 0x2B,
    i8080_INR_L      = 0x2C,
    i8080_DCR_L      = 0x2D,
    i8080_MVI_L      = 0x2E,
    i8080_CMA        = 0x2F,
    i8080_LXI_SP     = 0x31,
    i8080_STA        = 0x32,
    i8080_INX_SP     = 0x33,
    i8080_INR_M      = 0x34,
    i8080_DCR_M      = 0x35,
    i8080_MVI_M      = 0x36,
    i8080_STC        = 0x37,
    i8080_DAD_SP     = 0x39,
    i8080_LDA        = 0x3A,
    i8080_DCX_SP     = 0x3B,
    i8080_INR_A      = 0x3C,
    i8080_DCR_A      = 0x3D,
    i8080_MVI_A      = 0x3E,
    i8080_CMC        = 0x3F,
    i8080_MOV_B_B    = 0x40,
    i8080_MOV_B_C    = 0x41,
    i8080_MOV_B_D    = 0x42,
    i8080_MOV_B_E    = 0x43,
    i8080_MOV_B_H    = 0x44,
    i8080_MOV_B_L    = 0x45,
    i8080_MOV_B_M    = 0x46,
    i8080_MOV_B_A    = 0x47,
    i8080_MOV_C_B    = 0x48,
    i8080_MOV_C_C    = 0x49,
    i8080_MOV_C_D    = 0x4A,
    i8080_MOV_C_E    = 0x4B,
    i8080_MOV_C_H    = 0x4C,
    i8080_MOV_C_L    = 0x4D,
    i8080_MOV_C_M    = 0x4E,
    i8080_MOV_C_A    = 0x4F,
    i8080_MOV_D_B    = 0x50,
    i8080_MOV_D_C    = 0x51,
    i8080_MOV_D_D    = 0x52,
    i8080_MOV_D_E    = 0x53,
    i8080_MOV_D_H    = 0x54,
    i8080_MOV_D_L    = 0x55,
    i8080_MOV_D_M    = 0x56,
    i8080_MOV_D_A    = 0x57,
    i8080_MOV_E_B    = 0x58,
    i8080_MOV_E_C    = 0x59,
    i8080_MOV_E_D    = 0x5A,
    i8080_MOV_E_E    = 0x5B,
    i8080_MOV_E_H    = 0x5C,
    i8080_MOV_E_L    = 0x5D,
    i8080_MOV_E_M    = 0x5E,
    i8080_MOV_E_A    = 0x5F,
    i8080_MOV_H_B    = 0x60,
    i8080_MOV_H_C    = 0x61,
    i8080_MOV_H_D    = 0x62,
    i8080_MOV_H_E    = 0x63,
    i8080_MOV_H_H    = 0x64,
    i8080_MOV_H_L    = 0x65,
    i8080_MOV_H_M    = 0x66,
    i8080_MOV_H_A    = 0x67,
    i8080_MOV_L_B    = 0x68,
    i8080_MOV_L_C    = 0x69,
    i8080_MOV_L_D    = 0x6A,
    i8080_MOV_L_E    = 0x6B,
    i8080_MOV_L_H    = 0x6C,
    i8080_MOV_L_L    = 0x6D,
    i8080_MOV_L_M    = 0x6E,
    i8080_MOV_L_A    = 0x6F,
    i8080_MOV_M_B    = 0x70,
    i8080_MOV_M_C    = 0x71,
    i8080_MOV_M_D    = 0x72,
    i8080_MOV_M_E    = 0x73,
    i8080_MOV_M_H    = 0x74,
    i8080_MOV_M_L    = 0x75,
    i8080_HLT        = 0x76,
    i8080_MOV_M_A    = 0x77,
    i8080_MOV_A_B    = 0x78,
    i8080_MOV_A_C    = 0x79,
    i8080_MOV_A_D    = 0x7A,
    i8080_MOV_A_E    = 0x7B,
    i8080_MOV_A_H    = 0x7C,
    i8080_MOV_A_L    = 0x7D,
    i8080_MOV_A_M    = 0x7E,
    i8080_MOV_A_A    = 0x7F,
    i8080_ADD_B      = 0x80,
    i8080_ADD_C      = 0x81,
    i8080_ADD_D      = 0x82,
    i8080_ADD_E      = 0x83,
    i8080_ADD_H      = 0x84,
    i8080_ADD_L      = 0x85,
    i8080_ADD_M      = 0x86,
    i8080_ADD_A      = 0x87,
    i8080_ADC_B      = 0x88,
    i8080_ADC_C      = 0x89,
    i8080_ADC_D      = 0x8A,
    i8080_ADC_E      = 0x8B,
    i8080_ADC_H      = 0x8C,
    i8080_ADC_L      = 0x8D,
    i8080_ADC_M      = 0x8E,
    i8080_ADC_A      = 0x8F,
    i8080_SUB_B      = 0x90,
    i8080_SUB_C      = 0x91,
    i8080_SUB_D      = 0x92,
    i8080_SUB_E      = 0x93,
    i8080_SUB_H      = 0x94,
    i8080_SUB_L      = 0x95,
    i8080_SUB_M      = 0x96,
    i8080_SUB_A      = 0x97,
    i8080_SBB_B      = 0x98,
    i8080_SBB_C      = 0x99,
    i8080_SBB_D      = 0x9A,
    i8080_SBB_E      = 0x9B,
    i8080_SBB_H      = 0x9C,
    i8080_SBB_L      = 0x9D,
    i8080_SBB_M      = 0x9E,
    i8080_SBB_A      = 0x9F,
    i8080_ANA_B      = 0xA0,
    i8080_ANA_C      = 0xA1,
    i8080_ANA_D      = 0xA2,
    i8080_ANA_E      = 0xA3,
    i8080_ANA_H      = 0xA4,
    i8080_ANA_L      = 0xA5,
    i8080_ANA_M      = 0xA6,
    i8080_ANA_A      = 0xA7,
    i8080_XRA_B      = 0xA8,
    i8080_XRA_C      = 0xA9,
    i8080_XRA_D      = 0xAA,
    i8080_XRA_E      = 0xAB,
    i8080_XRA_H      = 0xAC,
    i8080_XRA_L      = 0xAD,
    i8080_XRA_M      = 0xAE,
    i8080_XRA_A      = 0xAF,
    i8080_ORA_B      = 0xB0,
    i8080_ORA_C      = 0xB1,
    i8080_ORA_D      = 0xB2,
    i8080_ORA_E      = 0xB3,
    i8080_ORA_H      = 0xB4,
    i8080_ORA_L      = 0xB5,
    i8080_ORA_M      = 0xB6,
    i8080_ORA_A      = 0xB7,
    i8080_CMP_B      = 0xB8,
    i8080_CMP_C      = 0xB9,
    i8080_CMP_D      = 0xBA,
    i8080_CMP_E      = 0xBB,
    i8080_CMP_H      = 0xBC,
    i8080_CMP_L      = 0xBD,
    i8080_CMP_M      = 0xBE,
    i8080_CMP_A      = 0xBF,
    i8080_RNZ        = 0xC0,
    i8080_POP_B      = 0xC1,
    i8080_JNZ        = 0xC2,
    i8080_JMP        = 0xC3,
    i8080_CNZ        = 0xC4,
    i8080_PUSH_B     = 0xC5,
    i8080_ADI        = 0xC6,
    i8080_RST_0      = 0xC7,
    i8080_RZ         = 0xC8,
    i8080_RET        = 0xC9,
    i8080_JZ         = 0xCA,
    i8080_CZ         = 0xCC,
    i8080_CALL       = 0xCD,
    i8080_ACI        = 0xCE,
    i8080_RST_1      = 0xCF,
    i8080_RNC        = 0xD0,
    i8080_POP_D      = 0xD1,
    i8080_JNC        = 0xD2,
    i8080_OUT        = 0xD3,
    i8080_CNC        = 0xD4,
    i8080_PUSH_D     = 0xD5,
    i8080_SUI        = 0xD6,
    i8080_RST_2      = 0xD7,
    i8080_RC         = 0xD8,
    i8080_JC         = 0xDA,
    i8080_IN         = 0xDB,
    i8080_CC         = 0xDC,
    i8080_SBI        = 0xDE,
    i8080_RST_3      = 0xDF,
    i8080_RPO        = 0xE0,
    i8080_POP_H      = 0xE1,
    i8080_JPO        = 0xE2,
    i8080_XTHL       = 0xE3,
    i8080_CPO        = 0xE4,
    i8080_PUSH_H     = 0xE5,
    i8080_ANI        = 0xE6,
    i8080_RST_4      = 0xE7,
    i8080_RPE        = 0xE8,
    i8080_PCHL       = 0xE9,
    i8080_JPE        = 0xEA,
    i8080_XCHG       = 0xEB,
    i8080_CPE        = 0xEC,
    i8080_XRI        = 0xEE,
    i8080_RST_5      = 0xEF,
    i8080_RP         = 0xF0,
    i8080_POP_PSW    = 0xF1,
    i8080_JP         = 0xF2,
    i8080_DI         = 0xF3,
    i8080_CP         = 0xF4,
    i8080_PUSH_PSW   = 0xF5,
    i8080_ORI        = 0xF6,
    i8080_RST_6      = 0xF7,
    i8080_RM         = 0xF8,
    i8080_SPHL       = 0xF9,
    i8080_JM         = 0xFA,
    i8080_EI         = 0xFB,
    i8080_CM         = 0xFC,
    i8080_CPI        = 0xFE,
    i8080_RST_7      = 0xFF
};

#endif /* I8080_OPCODES_HPP */
